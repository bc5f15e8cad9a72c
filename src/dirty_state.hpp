#pragma once

// Tracks which derived artifacts are stale.
//   recalc: the iteration field no longer matches the viewport / iteration cap
//   redraw: the frame buffer no longer matches the field / palette
// A stale field always implies a stale frame.
class DirtyState {
public:
    enum class State { Clean, NeedsRecalc, NeedsRedraw, NeedsBoth };

    void mark_viewport_changed() { recalc = true; redraw = true; }
    void mark_palette_changed()  { redraw = true; }

    bool needs_recalc() const { return recalc; }
    bool needs_redraw() const { return redraw; }

    // Claim a pending rebuild. Flags are cleared before the rebuild runs, so a
    // command issued while it is running marks the result stale again.
    // Claiming a recalc leaves the frame stale.
    bool take_recalc()
    {
        if (!recalc) return false;
        recalc = false;
        redraw = true;
        return true;
    }

    bool take_redraw()
    {
        if (!redraw) return false;
        redraw = false;
        return true;
    }

    State state() const
    {
        if (recalc && redraw) return State::NeedsBoth;
        if (recalc)           return State::NeedsRecalc;
        if (redraw)           return State::NeedsRedraw;
        return State::Clean;
    }

private:
    bool recalc = true;
    bool redraw = true;
};

// Marks a draw in progress for the lifetime of the guard. A draw entered
// while another is running gets a nested() guard and must not rebuild.
class DrawGuard {
public:
    explicit DrawGuard(bool& in_progress) : flag(in_progress), owner(!in_progress) { flag = true; }
    ~DrawGuard() { if (owner) flag = false; }

    DrawGuard(const DrawGuard&)            = delete;
    DrawGuard& operator=(const DrawGuard&) = delete;

    // True when another draw was already running when this guard was taken.
    bool nested() const { return !owner; }

private:
    bool& flag;
    bool  owner;
};
