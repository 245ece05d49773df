#include "Explorer/Explorer.hpp"
#include "Explorer/Frontier.hpp"

#include <sstream>

const char* StateName(State s)
{
    switch (s)
    {
    case State::START:       return "start";
    case State::SCAN:        return "scan";
    case State::DECIDE:      return "decide";
    case State::MOVE:        return "move";
    case State::GOAL:        return "goal";
    case State::STUCK:       return "stuck";
    case State::UNREACHABLE: return "unreachable";
    case State::END:         return "end";
    }
    return "?";
}

static bool cancelled_(const Explorer* e)
{
    return e && e->cancel && e->cancel->load(std::memory_order_relaxed);
}

static std::string at_(Point p)
{
    std::ostringstream os;
    os << "(" << p.x << ", " << p.y << ")";
    return os.str();
}

Explorer::Explorer(const EnvironmentOracle& oracle, int32_t mazeSize, Pose start)
    : oracle_(oracle), grid_(mazeSize, start.At()), pose_(start)
{
    way.push_back({ (uint32_t)start.x, (uint32_t)start.y, 0 });
}

uint32_t AutoMoveLimit(int32_t mazeSize)
{
    if (mazeSize <= 0) return 0;
    if (mazeSize > 16383) return UINT32_MAX;
    const uint64_t d = (uint64_t)mazeSize;
    const uint64_t limit = 16u * d * d;
    return limit > UINT32_MAX ? UINT32_MAX : (uint32_t)limit;
}

uint32_t Explorer::MoveLimit() const
{
    if (maxMoves > 0) return maxMoves;
    return AutoMoveLimit(grid_.MazeSize());
}

bool Explorer::IsFinished() const
{
    return state == State::GOAL || state == State::STUCK ||
           state == State::UNREACHABLE || state == State::END;
}

void Explorer::update()
{
    if (IsFinished()) return;
    if (cancelled_(this)) { state = State::END; error = "Cancelled."; return; }

    timeStep += 1;

    switch (state)
    {
    case State::START:
        ++stats_.queries;
        if (oracle_.IsGoalHere(pose_))
        {
            found = true;
            state = State::GOAL;
            notify_();
            return;
        }
        state = State::SCAN;
        return;

    case State::SCAN:   scan_();   return;
    case State::DECIDE: decide_(); return;
    case State::MOVE:   move_();   return;
    default: return;
    }
}

bool Explorer::Run()
{
    while (!IsFinished())
        update();
    return found;
}

void Explorer::scan_()
{
    const Point here = pose_.At();

    // order is fixed by the facing at the start of the scan
    for (Direction d : Frontier::ScanningOrder(pose_.dir))
    {
        if (cancelled_(this)) { state = State::END; error = "Cancelled."; return; }
        if (grid_.DirectionRecorded(here, d)) continue;

        turnToFace_(d);

        ++stats_.queries;
        const bool wall = oracle_.IsWallAhead(pose_);
        grid_.RecordWall(here, d, wall);

        if (!wall)
        {
            ++stats_.queries;
            if (oracle_.IsGoalAhead(pose_))
            {
                advance_();
                found = true;
                state = State::GOAL;
                notify_();
                return;
            }

            ++stats_.queries;
            grid_.RecordCell(here, d, oracle_.IsPitAhead(pose_) ? Hazard::Pit : Hazard::None);
        }

        notify_();
    }

    state = State::DECIDE;
}

void Explorer::decide_()
{
    const Point here = pose_.At();

    target_ = Frontier::SelectBestMove(grid_, pose_);
    if (!target_)
    {
        state = State::STUCK;
        error = "No open direction from " + at_(here) + ".";
        return;
    }

    if (!Frontier::HasReachableFrontier(grid_, here))
    {
        state = State::UNREACHABLE;
        error = "Goal unreachable: every reachable cell is explored.";
        return;
    }

    if (stats_.moves >= MoveLimit())
    {
        state = State::END;
        error = "Move limit reached (" + std::to_string(MoveLimit()) + ").";
        return;
    }

    state = State::MOVE;
}

void Explorer::move_()
{
    if (!target_)
        throw std::logic_error("move without a selected direction");
    if (!grid_.ScanComplete(pose_.At()))
        throw std::logic_error("move from " + at_(pose_.At()) + " before its scan completed");

    turnToFace_(*target_);
    advance_();
    grid_.Visit(pose_.At());
    target_.reset();

    notify_();
    state = State::SCAN;
}

void Explorer::turnLeft_()
{
    pose_.dir = RotateLeft(pose_.dir);
    ++stats_.turns;
}

void Explorer::turnRight_()
{
    pose_.dir = RotateRight(pose_.dir);
    ++stats_.turns;
}

void Explorer::turnToFace_(Direction target)
{
    switch (RightTurnsBetween(pose_.dir, target))
    {
    case 1: turnRight_(); break;
    case 2: turnLeft_(); turnLeft_(); break;
    case 3: turnLeft_(); break;
    default: break;
    }
}

void Explorer::advance_()
{
    const Offset o = OffsetFor(pose_.dir, Step::Cell);
    pose_.x += o.dx;
    pose_.y += o.dy;
    ++stats_.moves;

    way.push_back({ (uint32_t)pose_.x, (uint32_t)pose_.y, stats_.moves });
}

void Explorer::notify_()
{
    if (onStep) onStep(grid_, pose_);
}
