#include <catch2/catch_test_macros.hpp>
#include <WindowCursor/WindowCursor.hpp>

#include <cmath>
#include <limits>

using namespace watchannotator::nav;

namespace
{
    void requireInvariant(const WindowCursor &cursor)
    {
        REQUIRE(cursor.length() >= 1);
        REQUIRE(cursor.startIndex() + cursor.length() <= cursor.size());
    }
} // namespace

TEST_CASE("WindowCursor is inert while empty", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {5, 1, 1});
    REQUIRE(cursor.state() == CursorState::Empty);
    REQUIRE_FALSE(cursor.stepForward());
    REQUIRE_FALSE(cursor.stepBackward());
    REQUIRE_FALSE(cursor.growWindow());
    REQUIRE_FALSE(cursor.shrinkWindow());
    REQUIRE_FALSE(cursor.gotoFraction(0.5));
    REQUIRE_FALSE(cursor.activate(0));
    REQUIRE(cursor.state() == CursorState::Empty);
}

TEST_CASE("Sensor cursor steps forward while the window end stays within the data", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {3, 1, 2});
    REQUIRE(cursor.activate(7));

    REQUIRE(cursor.stepForward()); // [2, 5)
    REQUIRE(cursor.stepForward()); // [4, 7) ends exactly at size
    REQUIRE(cursor.startIndex() == 4);
    REQUIRE_FALSE(cursor.stepForward());
    requireInvariant(cursor);

    REQUIRE(cursor.stepBackward());
    REQUIRE(cursor.stepBackward());
    REQUIRE(cursor.startIndex() == 0);
    REQUIRE_FALSE(cursor.stepBackward());
}

TEST_CASE("GPS cursor never lets the window reach the last item by stepping", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::gps(), {3, 1, 2});
    REQUIRE(cursor.activate(7));

    REQUIRE(cursor.stepForward()); // [2, 5)
    REQUIRE_FALSE(cursor.stepForward());
    REQUIRE(cursor.startIndex() == 2);
}

TEST_CASE("WindowCursor step and resize round trips restore the window", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {10, 5, 5});
    REQUIRE(cursor.activate(100));

    REQUIRE(cursor.stepForward());
    REQUIRE(cursor.stepBackward());
    REQUIRE(cursor.startIndex() == 0);

    REQUIRE(cursor.growWindow());
    REQUIRE(cursor.length() == 15);
    REQUIRE(cursor.shrinkWindow());
    REQUIRE(cursor.length() == 10);

    REQUIRE(cursor.shrinkWindow());
    REQUIRE(cursor.length() == 5);
    REQUIRE_FALSE(cursor.shrinkWindow());
}

TEST_CASE("WindowCursor refuses to grow past the data", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {8, 2, 1});
    REQUIRE(cursor.activate(10));
    REQUIRE(cursor.growWindow());
    REQUIRE(cursor.length() == 10);
    REQUIRE_FALSE(cursor.growWindow());
    requireInvariant(cursor);
}

TEST_CASE("Sensor goto scales the room left for the window", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {10, 1, 1});
    REQUIRE(cursor.activate(110));

    REQUIRE(cursor.gotoFraction(0.5));
    REQUIRE(cursor.startIndex() == 50);
    REQUIRE(cursor.gotoFraction(1.0));
    REQUIRE(cursor.startIndex() == 100);
    REQUIRE(cursor.gotoFraction(0.0));
    REQUIRE(cursor.startIndex() == 0);

    REQUIRE_FALSE(cursor.gotoFraction(1.5));
    REQUIRE_FALSE(cursor.gotoFraction(-0.1));
    REQUIRE_FALSE(cursor.gotoFraction(std::numeric_limits<double>::quiet_NaN()));
    REQUIRE(cursor.startIndex() == 0);
}

TEST_CASE("GPS goto scales the whole track and keeps the window inside", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::gps(), {10, 1, 1});
    REQUIRE(cursor.activate(100));

    REQUIRE(cursor.gotoFraction(0.5));
    REQUIRE(cursor.startIndex() == 50);
    REQUIRE(cursor.gotoFraction(0.95));
    REQUIRE(cursor.startIndex() == 90);
    requireInvariant(cursor);
}

TEST_CASE("WindowCursor clamps settings to the data size", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {500, 10, 10});
    REQUIRE(cursor.activate(6));

    const WindowSettings effective = cursor.settings();
    REQUIRE(effective.length == 6);
    REQUIRE(effective.resizeStep == 3);
    REQUIRE(effective.navigateStep == 3);
    REQUIRE(cursor.requestedSettings() == WindowSettings{500, 10, 10});
    requireInvariant(cursor);
}

TEST_CASE("WindowCursor pulls the start back when a new length no longer fits", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {2, 1, 1});
    REQUIRE(cursor.activate(10));
    REQUIRE(cursor.gotoFraction(1.0));
    REQUIRE(cursor.startIndex() == 8);

    const WindowSettings effective = cursor.applyWindowSizePolicy({5, 1, 1});
    REQUIRE(effective.length == 5);
    REQUIRE(cursor.startIndex() == 5);
    requireInvariant(cursor);
}

TEST_CASE("WindowCursor over a single item reports zero steps as failures", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {500, 10, 10});
    REQUIRE(cursor.activate(1));
    REQUIRE(cursor.length() == 1);
    REQUIRE(cursor.settings().navigateStep == 0);

    REQUIRE_FALSE(cursor.stepForward());
    REQUIRE_FALSE(cursor.stepBackward());
    REQUIRE_FALSE(cursor.growWindow());
    REQUIRE_FALSE(cursor.shrinkWindow());
    REQUIRE(cursor.gotoFraction(0.3));
    REQUIRE(cursor.startIndex() == 0);
}

TEST_CASE("WindowCursor enforces a minimum length of one", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::gps(), {0, 1, 1});
    REQUIRE(cursor.length() == 1);
    REQUIRE(cursor.activate(4));
    REQUIRE(cursor.contains(0));
    REQUIRE_FALSE(cursor.contains(1));

    cursor.reset();
    REQUIRE(cursor.state() == CursorState::Empty);
    REQUIRE_FALSE(cursor.contains(0));
}

TEST_CASE("WindowCursor invariant holds under mixed operations", "[WindowCursor]")
{
    WindowCursor cursor(CursorPolicy::sensor(), {7, 3, 4});
    REQUIRE(cursor.activate(23));

    for (int i = 0; i < 200; ++i)
    {
        switch (i % 7)
        {
        case 0:
        case 1:
            cursor.stepForward();
            break;
        case 2:
            cursor.growWindow();
            break;
        case 3:
            cursor.stepBackward();
            break;
        case 4:
            cursor.shrinkWindow();
            break;
        case 5:
            cursor.gotoFraction(std::fmod(i * 0.37, 1.0));
            break;
        default:
            cursor.growWindow();
            cursor.growWindow();
            break;
        }
        requireInvariant(cursor);
    }
}
