#include "bjd/bjd.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static void usage() {
    std::cerr <<
        "bjdview - BJData/UBJSON viewer\n"
        "\n"
        "Usage:\n"
        "  bjdview <FILE> [--max-data N] [--max-str N] [--debug] [--big-endian|--be] [--no-color] [--tui]\n"
        "\n"
        "  --max-data N   collapse containers with more than N items (default 100)\n"
        "  --max-str N    shorten strings longer than N characters (default 200)\n"
        "  --debug        hex dump of the input head and a decode trace\n"
        "  --big-endian   decode UBJSON / BJData draft 1 (alias --be)\n"
        "  --tui          interactive pager\n";
}

struct Args {
    std::string file;
    std::size_t max_data{100};
    std::size_t max_str{200};
    bool debug{false};
    bool big_endian{false};
    bool no_color{false};
    bool tui{false};
};

static bool parse_size(const char* s, std::size_t& out) {
    std::string v(s);
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = static_cast<std::size_t>(std::stoull(v));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

static bool parse_args(int argc, char** argv, Args& a) {
    int i = 1;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--debug") a.debug = true;
        else if (opt == "--big-endian" || opt == "--be") a.big_endian = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--tui") a.tui = true;
        else if (opt == "--max-data" && i < argc) {
            if (!parse_size(argv[i++], a.max_data)) {
                std::cerr << "Invalid value for --max-data\n";
                return false;
            }
        } else if (opt == "--max-str" && i < argc) {
            if (!parse_size(argv[i++], a.max_str)) {
                std::cerr << "Invalid value for --max-str\n";
                return false;
            }
        } else if (opt.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        } else if (a.file.empty()) {
            a.file = opt;
        } else {
            std::cerr << "Unexpected argument: " << opt << "\n";
            return false;
        }
    }
    return !a.file.empty();
}

// ----------------- Hex dumps -----------------

static void error_window(std::ostream& os, const std::vector<std::uint8_t>& data, std::size_t pos) {
    std::size_t s = pos > 32 ? pos - 32 : 0;
    std::size_t e = std::min(data.size(), pos + 64);
    os << "Hex [" << s << ":" << e << "]:\n";
    bjd::hex_dump(os, data.data(), data.size(), s, e);
}

// ----------------- TUI pager -----------------

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static ftxui::Element colored_line(const std::string& line) {
    using namespace ftxui;

    if (line.rfind("#", 0) == 0) return text(line) | color(Color::GrayDark);

    std::size_t lead = line.find_first_not_of(' ');
    if (lead == std::string::npos) return text(line);
    std::string pad = line.substr(0, lead);
    std::string rest = line.substr(lead);

    // Previews and SOA headers.
    if (rest.rfind("<", 0) == 0 || rest.rfind("...", 0) == 0) {
        return hbox({text(pad), text(rest) | color(Color::Magenta)});
    }

    // "key": value
    if (rest.rfind("\"", 0) == 0) {
        auto sep = rest.find("\": ");
        if (sep != std::string::npos) {
            std::string k = rest.substr(0, sep + 1);
            std::string v = rest.substr(sep + 3);
            Color vc = v.rfind("\"", 0) == 0 ? Color::Green
                       : v.rfind("<", 0) == 0 ? Color::Magenta
                                              : Color::GrayLight;
            return hbox({
                text(pad),
                text(k) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(v) | color(vc) | flex,
            });
        }
        return hbox({text(pad), text(rest) | color(Color::Green)});
    }
    return text(line);
}

static int run_tui(const std::string& title, const std::string& status, const std::vector<std::string>& lines) {
    using namespace ftxui;

    int top = 0;
    auto screen = ScreenInteractive::Fullscreen();
    screen.TrackMouse(true);

    auto page_height = [] { return std::max(1, ftxui::Terminal::Size().dimy - 4); };
    auto max_top = [&] { return std::max(0, static_cast<int>(lines.size()) - page_height()); };

    auto view = Renderer([&] {
        std::vector<Element> rows;
        int h = page_height();
        for (int i = top; i < static_cast<int>(lines.size()) && i < top + h; ++i) {
            rows.push_back(colored_line(lines[static_cast<std::size_t>(i)]));
        }
        std::string pos = std::to_string(lines.empty() ? 0 : top + 1) + "/" + std::to_string(lines.size());
        return vbox({
                   vbox(std::move(rows)) | flex | border | size(HEIGHT, EQUAL, h + 2),
                   hbox({
                       text(" " + title + " ") | bold | inverted,
                       text(" " + status) | color(Color::GrayLight) | flex,
                       text(pos + " ") | color(Color::GrayDark),
                   }),
               });
    });

    auto app = CatchEvent(view, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (e == Event::ArrowUp) { top = std::max(0, top - 1); return true; }
        if (e == Event::ArrowDown) { top = std::min(max_top(), top + 1); return true; }
        if (e == Event::PageUp) { top = std::max(0, top - page_height()); return true; }
        if (e == Event::PageDown) { top = std::min(max_top(), top + page_height()); return true; }
        if (e == Event::Home) { top = 0; return true; }
        if (e == Event::End) { top = max_top(); return true; }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) { top = std::max(0, top - 3); return true; }
            if (m.button == Mouse::WheelDown) { top = std::min(max_top(), top + 3); return true; }
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty() && !a.tui;

    std::vector<std::uint8_t> data;
    try {
        data = bjd::load_file(a.file);
    } catch (const bjd::BjdError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    std::ostringstream out;
    out << "# File: " << a.file << " (" << data.size() << " bytes)\n";
    if (a.big_endian) out << "# Mode: Big-endian (UBJSON/BJData Draft 1)\n";
    out << "\n";

    if (a.debug) {
        out << "# First " << std::min<std::size_t>(256, data.size()) << " bytes:\n";
        bjd::hex_dump(out, data.data(), data.size(), 0, 256);
        out << "\n";
    }

    bjd::RenderOptions ropts;
    ropts.max_items = a.max_data;
    ropts.max_string = a.max_str;

    std::size_t consumed = data.size();
    std::string rendered;
    bool done = false;

    if (bjd::looks_like_json(data.data(), data.size())) {
        try {
            std::string text(data.begin(), data.end());
            rendered = bjd::render(bjd::parse_json_text(text), ropts);
            done = true;
        } catch (const bjd::BjdError& e) {
            if (a.debug) out << "# JSON parse failed at " << e.offset() << ": " << e.what() << ", trying BJData\n";
        }
    }

    if (!done) {
        bjd::DecodeOptions dopts;
        dopts.byte_order = a.big_endian ? bjd::ByteOrder::Big : bjd::ByteOrder::Little;
        dopts.max_items = a.max_data;
        if (a.debug) dopts.trace = &out;
        try {
            bjd::Value v = bjd::decode(data.data(), data.size(), dopts, &consumed);
            rendered = bjd::render(v, ropts);
        } catch (const bjd::BjdError& e) {
            std::cout << out.str() << std::flush;
            std::cerr << ansi.red() << "Error at " << e.offset() << ansi.reset() << ": " << e.what() << "\n";
            error_window(std::cerr, data, e.offset());
            return 1;
        } catch (const std::exception& e) {
            std::cout << out.str() << std::flush;
            std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
            return 1;
        }
    }

    out << rendered << "\n";
    std::size_t remaining = data.size() - consumed;
    if (remaining > 0) out << "\n# " << remaining << " bytes remaining\n";

    if (a.tui) {
        std::string status = std::to_string(data.size()) + " bytes, " +
                             (a.big_endian ? "big-endian" : "little-endian") + ", " +
                             std::to_string(remaining) + " bytes remaining";
        return run_tui(a.file, status, split_lines(out.str()));
    }

    if (!ansi.enabled) {
        std::cout << out.str();
        return 0;
    }
    for (const auto& line : split_lines(out.str())) {
        std::size_t lead = line.find_first_not_of(' ');
        if (line.rfind("#", 0) == 0) std::cout << ansi.dim() << line << ansi.reset() << "\n";
        else if (lead != std::string::npos && line[lead] == '<') std::cout << ansi.cyan() << line << ansi.reset() << "\n";
        else std::cout << line << "\n";
    }
    return 0;
}
