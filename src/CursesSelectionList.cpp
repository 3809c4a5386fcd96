#include "CursesSelectionList.hpp"
#include "PromptErrors.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

// last: curses.h defines function-like macros (erase, refresh, ...)
#include <curses.h>

namespace {
    constexpr int kCtrlC  = 3;
    constexpr int kEscape = 27;

    const char* const kHelp =
        "[Use arrows to move, space to select, <right> to all, <left> to none]";

    // endwin + delscreen for a SCREEN created with newterm
    struct ScreenCloser {
        void operator()(SCREEN* screen) const {
            if (screen) {
                endwin();
                delscreen(screen);
            }
        }
    };

    struct ListState {
        std::vector<bool>        checked;
        std::vector<std::size_t> order;   // checked indices, in toggle order
        std::size_t cursor = 0;
        std::size_t top    = 0;           // first visible row

        void check(std::size_t i) {
            if (checked[i]) return;
            checked[i] = true;
            order.push_back(i);
        }
        void uncheck(std::size_t i) {
            if (!checked[i]) return;
            checked[i] = false;
            auto last = std::remove(order.begin(), order.end(), i);
            order.resize(static_cast<std::size_t>(last - order.begin()));
        }
        void toggle(std::size_t i) {
            if (checked[i]) uncheck(i); else check(i);
        }
    };

    void render(const SelectionRequest& req, ListState& st, std::size_t page) {
        if (st.cursor < st.top) st.top = st.cursor;
        if (st.cursor >= st.top + page) st.top = st.cursor - page + 1;

        erase();
        attron(A_BOLD);
        mvaddnstr(0, 0, ("? " + req.label + " ").c_str(), COLS);
        attroff(A_BOLD);
        addnstr(kHelp, std::max(0, COLS - getcurx(stdscr)));

        const std::size_t end = std::min(req.options.size(), st.top + page);
        for (std::size_t i = st.top; i < end; ++i) {
            const int row = static_cast<int>(i - st.top) + 1;
            std::string line = (i == st.cursor) ? "> " : "  ";
            line += st.checked[i] ? "[x] " : "[ ] ";
            line += req.options[i];
            if (i == st.cursor) attron(A_REVERSE);
            mvaddnstr(row, 0, line.c_str(), COLS);
            if (i == st.cursor) attroff(A_REVERSE);
        }
        refresh();
    }
}

CursesSelectionList::CursesSelectionList(std::FILE* in, std::FILE* out)
    : m_in(in), m_out(out)
{
}

std::vector<std::size_t> CursesSelectionList::select(const SelectionRequest& request) {
    if (request.options.empty()) return {};

    std::unique_ptr<SCREEN, ScreenCloser> screen(newterm(nullptr, m_out, m_in));
    if (!screen) {
        throw std::runtime_error("newterm failed: cannot open the terminal for the selection list");
    }
    set_term(screen.get());
    raw();            // Ctrl-C arrives as a key, not as SIGINT
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);

    ListState st;
    st.checked.assign(request.options.size(), false);
    for (std::size_t i : request.preselected) {
        if (i < request.options.size()) st.check(i);
    }

    const std::size_t last = request.options.size() - 1;
    for (;;) {
        const int rows = std::max(1, LINES - 1);
        std::size_t page = std::min<std::size_t>(request.pageSize, request.options.size());
        page = std::max<std::size_t>(1, std::min<std::size_t>(page, static_cast<std::size_t>(rows)));
        render(request, st, page);

        const int key = getch();
        switch (key) {
        case KEY_UP:
        case 'k':
            st.cursor = (st.cursor == 0) ? last : st.cursor - 1;
            break;
        case KEY_DOWN:
        case 'j':
            st.cursor = (st.cursor == last) ? 0 : st.cursor + 1;
            break;
        case ' ':
            st.toggle(st.cursor);
            break;
        case KEY_RIGHT:
            for (std::size_t i = 0; i <= last; ++i) st.check(i);
            break;
        case KEY_LEFT:
            for (std::size_t i = 0; i <= last; ++i) st.uncheck(i);
            break;
        case '\n':
        case '\r':
        case KEY_ENTER:
            return st.order;
        case kEscape:
        case kCtrlC:
            throw PromptInterrupted("selection aborted");
        case ERR:
            throw std::runtime_error("getch failed while reading the selection list");
        default:
            break; // KEY_RESIZE and anything else: just redraw
        }
    }
}
