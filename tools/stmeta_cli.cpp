#include "stmeta/library.hpp"
#include "stmeta/log.hpp"
#include "stmeta/safetensors.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

namespace fs = std::filesystem;

namespace {

using stmeta::Ansi;

static std::string fmt_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    std::ostringstream oss;
    if (u == 0) oss << bytes << " B";
    else oss << std::fixed << std::setprecision(1) << v << " " << units[u];
    return oss.str();
}

static std::string fmt_field(const stmeta::Json* j) {
    if (!j) return "?";
    if (j->is_string()) return j->as_string();
    return stmeta::dump_json(*j);
}

static void usage() {
    std::cerr <<
        "stmeta - safetensors metadata inspector\n"
        "\n"
        "Usage:\n"
        "  stmeta header <FILE> [--raw] [--tensors] [--no-color]\n"
        "  stmeta meta   <FILE> [--formatted] [--no-color]\n"
        "  stmeta set    <FILE> KEY=VALUE... [--unset KEY] [--json] [--no-color]\n"
        "  stmeta list   <DIR> [--no-color]\n"
        "  stmeta browse <DIR>\n";
}

struct Args {
    std::string cmd;
    std::string target;
    bool raw{false};
    bool tensors{false};
    bool formatted{false};
    bool json_values{false};
    bool no_color{false};
    std::vector<std::pair<std::string, std::string>> assignments;
    std::vector<std::string> unset;
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.target = argv[2];

    int i = 3;
    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--raw") a.raw = true;
        else if (opt == "--tensors") a.tensors = true;
        else if (opt == "--formatted") a.formatted = true;
        else if (opt == "--json") a.json_values = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--unset" && i < argc) a.unset.push_back(argv[i++]);
        else if (a.cmd == "set" && opt.rfind("--", 0) != 0 && opt.find('=') != std::string::npos) {
            auto eq = opt.find('=');
            a.assignments.emplace_back(opt.substr(0, eq), opt.substr(eq + 1));
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "header" && a.cmd != "meta" && a.cmd != "set" && a.cmd != "list" && a.cmd != "browse") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    if (a.cmd == "set" && a.assignments.empty() && a.unset.empty()) {
        std::cerr << "set: nothing to change\n";
        return false;
    }
    return true;
}

// ----------------- Text commands -----------------

static void print_metadata(const stmeta::ExtractedMetadata& md, const Ansi& ansi, bool formatted) {
    if (formatted) {
        for (const auto& [key, value] : md.formatted_metadata) {
            std::cout << ansi.cyan() << key << ansi.reset() << " = " << value.as_string() << "\n";
        }
        return;
    }
    for (const auto& [key, value] : md.metadata) {
        std::cout << ansi.cyan() << key << ansi.reset() << " ";
        if (value.is_structured()) {
            std::cout << ansi.gray() << "[json]" << ansi.reset() << " "
                      << ansi.yellow() << stmeta::dump_json(value.structured()) << ansi.reset() << "\n";
        } else {
            std::cout << ansi.gray() << "[text]" << ansi.reset() << " " << value.raw() << "\n";
        }
    }
}

static int cmd_header(const Args& a, const Ansi& ansi) {
    const stmeta::HeaderFileInfo info = stmeta::read_header_only(a.target);
    const auto& d = info.decoded;

    std::size_t meta_keys = 0;
    if (const stmeta::Json* md = d.raw_header.find(stmeta::kMetadataKey); md && md->is_object()) {
        meta_keys = md->as_object().size();
    }

    std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.target << "\n";
    std::cout << ansi.bold() << "Header len" << ansi.reset() << ": " << d.header_length << " bytes\n";
    std::cout << ansi.bold() << "Payload offset" << ansi.reset() << ": " << d.payload_offset << "\n";
    std::cout << ansi.bold() << "Payload size" << ansi.reset() << ": "
              << fmt_size(info.file_size - d.payload_offset) << "\n";
    std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << info.file_size << "\n";
    std::cout << ansi.bold() << "Tensors" << ansi.reset() << ": " << stmeta::tensor_count(d.raw_header) << "\n";
    std::cout << ansi.bold() << "Metadata keys" << ansi.reset() << ": " << meta_keys << "\n";

    if (a.tensors) {
        for (const auto& [name, desc] : d.raw_header.as_object()) {
            if (name == stmeta::kMetadataKey) continue;
            std::cout << "  " << ansi.cyan() << name << ansi.reset()
                      << " " << ansi.yellow() << fmt_field(desc.find("dtype")) << ansi.reset()
                      << " " << ansi.gray() << fmt_field(desc.find("shape")) << ansi.reset() << "\n";
        }
    }

    if (a.raw) {
        std::cout << stmeta::dump_json(d.raw_header) << "\n";
    } else {
        std::cout << ansi.dim() << "(use --raw to print raw header JSON)\n" << ansi.reset();
    }
    return 0;
}

static int cmd_meta(const Args& a, const Ansi& ansi) {
    const stmeta::HeaderFileInfo info = stmeta::read_header_only(a.target);
    try {
        print_metadata(stmeta::extract_metadata(info.decoded.raw_header), ansi, a.formatted);
    } catch (const stmeta::StmetaError& e) {
        if (e.kind() != stmeta::ErrorKind::NoMetadata) throw;
        std::cout << ansi.dim() << "(no metadata)" << ansi.reset() << "\n";
    }
    return 0;
}

static int cmd_set(const Args& a, const Ansi& ansi) {
    const fs::path file = fs::absolute(a.target);
    stmeta::LibraryConfig lc;
    lc.root = file.parent_path();
    stmeta::ModelLibrary lib(lc);
    const std::string name = file.filename().string();

    stmeta::Json current = stmeta::Json::object();
    if (auto report = lib.read_metadata(name); report.metadata) {
        current = report.metadata->formatted_json();
    }

    for (const auto& [key, value] : a.assignments) {
        current.set(key, a.json_values ? stmeta::parse_json(value) : stmeta::Json::string(value));
    }
    for (const auto& key : a.unset) {
        if (!current.erase(key)) {
            std::cerr << ansi.yellow() << "Warning" << ansi.reset() << ": no metadata key '" << key << "'\n";
        }
    }

    const stmeta::MetadataReport report = lib.update_metadata(name, current.as_object());
    std::cout << ansi.green() << "Updated" << ansi.reset() << " " << a.target
              << " (" << current.as_object().size() << " keys, header " << report.header_length
              << " bytes, payload crc32 " << stmeta::hex8(report.payload_crc32.value_or(0)) << ")\n";
    if (report.metadata) print_metadata(*report.metadata, ansi, false);
    return 0;
}

static int cmd_list(const Args& a, const Ansi& ansi) {
    stmeta::LibraryConfig lc;
    lc.root = a.target;
    stmeta::ModelLibrary lib(lc);
    const auto files = lib.list_files();

    std::cout << ansi.bold() << "Directory" << ansi.reset() << ": " << lib.root().string() << "\n";
    for (const auto& f : files) {
        std::cout << "  " << ansi.cyan() << f.relative_path << ansi.reset()
                  << " " << ansi.gray() << fmt_size(f.size) << ansi.reset()
                  << " " << ansi.yellow() << stmeta::to_string(f.format) << ansi.reset() << "\n";
    }
    std::cout << ansi.dim() << files.size() << " files" << ansi.reset() << "\n";
    return 0;
}

// ----------------- Interactive browser (FTXUI) -----------------

struct BrowseState {
    std::vector<stmeta::FileInfo> files;
    std::vector<std::string> entries; // menu labels, one per file
    int selected{0};
    int loaded{-1};
    std::optional<stmeta::MetadataReport> report;
    std::string error;
};

static void load_selected(const stmeta::ModelLibrary& lib, BrowseState& st) {
    if (st.loaded == st.selected) return;
    st.loaded = st.selected;
    st.report.reset();
    st.error.clear();
    if (st.selected < 0 || static_cast<std::size_t>(st.selected) >= st.files.size()) return;

    const stmeta::FileInfo& f = st.files[static_cast<std::size_t>(st.selected)];
    if (f.format != stmeta::FileFormat::Safetensors) {
        st.error = "metadata is only available for .safetensors files";
        return;
    }
    try {
        st.report = lib.read_metadata(f.relative_path);
    } catch (const stmeta::StmetaError& e) {
        st.error = "[" + stmeta::to_string(e.kind()) + "] " + e.what();
    }
}

static ftxui::Element kv_line(const std::string& k, const std::string& v, ftxui::Color value_color) {
    using namespace ftxui;
    return hbox({
        text(k) | bold | color(Color::Yellow),
        text(": ") | color(Color::GrayDark),
        paragraph(v) | color(value_color) | flex,
    });
}

static ftxui::Element render_details(const BrowseState& st) {
    using namespace ftxui;
    if (st.files.empty()) {
        return text("(no .safetensors or .gguf files)") | color(Color::GrayDark) | flex;
    }

    const stmeta::FileInfo& f = st.files[static_cast<std::size_t>(st.selected)];
    std::vector<Element> rows;
    rows.push_back(text(f.relative_path) | bold | color(Color::Green));
    rows.push_back(separator());
    rows.push_back(kv_line("format", stmeta::to_string(f.format), Color::GrayLight));
    rows.push_back(kv_line("size", fmt_size(f.size), Color::GrayLight));
    if (!st.error.empty()) rows.push_back(kv_line("error", st.error, Color::Red));

    if (st.report) {
        const stmeta::MetadataReport& r = *st.report;
        rows.push_back(kv_line("header", std::to_string(r.header_length) + " bytes", Color::GrayLight));
        rows.push_back(kv_line("payload offset", std::to_string(r.payload_offset), Color::GrayLight));
        rows.push_back(kv_line("tensors", std::to_string(r.tensor_count), Color::GrayLight));
        rows.push_back(separator());
        rows.push_back(text("metadata") | bold | color(Color::Magenta));

        if (!r.metadata) {
            rows.push_back(text("(none)") | color(Color::GrayDark));
        } else {
            for (const auto& [key, value] : r.metadata->metadata) {
                const bool structured = value.is_structured();
                rows.push_back(hbox({
                    text(key) | bold | color(Color::Yellow),
                    text(structured ? " json " : " text ") | color(Color::GrayDark),
                    paragraph(structured ? stmeta::dump_json(value.structured()) : value.raw())
                        | color(structured ? Color::Cyan : Color::Green) | flex,
                }));
            }
        }
    }
    return vbox(std::move(rows)) | vscroll_indicator | frame | flex;
}

static int cmd_browse(const Args& a) {
    using namespace ftxui;

    stmeta::LibraryConfig lc;
    lc.root = a.target;
    const stmeta::ModelLibrary lib(lc);

    BrowseState st;
    st.files = lib.list_files();
    for (const auto& f : st.files) {
        st.entries.push_back(f.relative_path + "  " + fmt_size(f.size));
    }
    load_selected(lib, st);

    auto screen = ScreenInteractive::Fullscreen();

    MenuOption opt = MenuOption::Vertical();
    opt.on_change = [&] { load_selected(lib, st); };
    auto menu = Menu(&st.entries, &st.selected, opt);

    auto layout = Renderer(menu, [&] {
        auto header = hbox({
            text("stmeta") | bold | color(Color::White),
            text("  "),
            text(lib.root().string()) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" select") | color(Color::GrayDark),
        });
        return vbox({
            header,
            separator(),
            hbox({
                menu->Render() | vscroll_indicator | frame | size(WIDTH, EQUAL, 60),
                separator(),
                render_details(st),
            }) | flex,
        }) | border;
    });

    auto app = CatchEvent(layout, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
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
    ansi.enabled = !a.no_color && stmeta::is_tty();

    try {
        if (a.cmd == "header") return cmd_header(a, ansi);
        if (a.cmd == "meta") return cmd_meta(a, ansi);
        if (a.cmd == "set") return cmd_set(a, ansi);
        if (a.cmd == "list") return cmd_list(a, ansi);
        if (a.cmd == "browse") return cmd_browse(a);
    } catch (const stmeta::StmetaError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " [" << stmeta::to_string(e.kind()) << "]: "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
