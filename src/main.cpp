#include "config.hpp"
#include "errors.hpp"
#include "librarian.hpp"
#include "metadata_store.hpp"
#include "playback_controller.hpp"
#include "sound_editor.hpp"
#include "waveform_renderer.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <vector>
#include <sstream>

namespace clipshelf {

class ClipShelfApp {
private:
    AppConfig m_config;
    std::unique_ptr<Librarian> m_librarian;
    WaveformRenderer m_renderer;
    SoundEditor m_editor;

    static constexpr int DEFAULT_WAVEFORM_WIDTH = 72;
    static constexpr int WAVEFORM_HEIGHT = 12;

public:
    explicit ClipShelfApp(AppConfig config) : m_config(std::move(config)) {
        m_librarian = std::make_unique<Librarian>(create_metadata_store(m_config.resolved_database_path()));
    }

    int run() {
        const std::string& command = m_config.command;
        const auto& args = m_config.arguments;

        if (command == "scan") {
            expect_arguments(0, 0);
            return scan();
        } else if (command == "list") {
            expect_arguments(0, 0);
            return list();
        } else if (command == "info") {
            expect_arguments(1, 1);
            return info(resolve(args[0]));
        } else if (command == "tag") {
            expect_arguments(1, SIZE_MAX);
            return tag(resolve(args[0]), std::set<std::string>(args.begin() + 1, args.end()));
        } else if (command == "describe") {
            expect_arguments(2, SIZE_MAX);
            return describe(resolve(args[0]), join(args.begin() + 1, args.end()));
        } else if (command == "find") {
            expect_arguments(1, 1);
            return find(args[0]);
        } else if (command == "tags") {
            expect_arguments(0, 0);
            return tags();
        } else if (command == "waveform") {
            expect_arguments(1, 2);
            int width = args.size() > 1
                ? static_cast<int>(parse_count(args[1], "width", std::numeric_limits<int>::max()))
                : DEFAULT_WAVEFORM_WIDTH;
            return waveform(resolve(args[0]), width);
        } else if (command == "search") {
            expect_arguments(0, SIZE_MAX);
            return search(join(args.begin(), args.end()));
        } else if (command == "crop") {
            expect_arguments(4, 4);
            Selection selection = parse_selection(args[1], args[2]);
            return save(m_librarian->load_region(resolve(args[0]), selection), args[3]);
        } else if (command == "reverse") {
            if (args.size() != 2 && args.size() != 4) {
                throw InvalidArgument("reverse expects <path> <out> [start end]");
            }
            AudioFile audio = m_librarian->load(resolve(args[0]));
            std::optional<Selection> selection;
            if (args.size() == 4) {
                selection = parse_selection(args[2], args[3]);
            }
            return save(m_editor.reverse(audio, selection), args[1]);
        } else if (command == "remove-region") {
            expect_arguments(4, 4);
            Selection selection = parse_selection(args[1], args[2]);
            AudioFile audio = m_librarian->load(resolve(args[0]));
            return save(m_editor.remove(audio, selection), args[3]);
        } else if (command == "gate") {
            expect_arguments(3, 3);
            double threshold_db = parse_number(args[1], "threshold");
            AudioFile audio = m_librarian->load(resolve(args[0]));
            return save(m_editor.gate(audio, threshold_db), args[2]);
        } else if (command == "filter") {
            return filter();
        } else if (command == "pitch") {
            expect_arguments(3, 3);
            double semitones = parse_number(args[1], "semitones");
            AudioFile audio = m_librarian->load(resolve(args[0]));
            return save(m_editor.pitch_shift(audio, semitones), args[2]);
        } else if (command == "speed") {
            expect_arguments(3, 3);
            double factor = parse_speed(args[1]);
            AudioFile audio = m_librarian->load(resolve(args[0]));
            return save(m_editor.change_speed(audio, factor), args[2]);
        } else if (command == "snippet") {
            expect_arguments(2, 3);
            uint32_t seed = args.size() > 2
                ? static_cast<uint32_t>(parse_count(args[2], "seed", std::numeric_limits<uint32_t>::max()))
                : std::random_device{}();
            AudioFile audio = m_librarian->load(resolve(args[0]));
            AudioFile snippet = m_editor.random_snippet(audio, seed);
            std::cout << "Snippet of " << snippet.frame_count() << " frames (seed " << seed << ")\n";
            return save(snippet, args[1]);
        } else if (command == "play") {
            return play();
        } else if (command == "rename") {
            expect_arguments(2, 2);
            m_librarian->rename(resolve(args[0]), resolve(args[1]));
            std::cout << "Renamed " << args[0] << " -> " << args[1] << "\n";
            return 0;
        } else if (command == "delete") {
            expect_arguments(1, 1);
            m_librarian->remove(resolve(args[0]));
            std::cout << "Deleted " << args[0] << "\n";
            return 0;
        } else if (command == "import") {
            expect_arguments(1, 1);
            MetadataRecord record = m_librarian->import_file(args[0], m_config.library_dir);
            std::cout << "Imported " << record.path << "\n";
            return 0;
        }

        throw InvalidArgument("Unknown command: " + command);
    }

private:
    int scan() {
        ReconcileReport report = m_librarian->reconcile(m_config.library_dir);
        std::cout << "Added " << report.added << ", removed " << report.removed
                  << ", refreshed " << report.refreshed << "\n";
        for (const auto& failure : report.failures) {
            std::cerr << "Unreadable: " << failure.path << ": " << failure.message << "\n";
        }
        return 0;
    }

    int list() {
        RecordList records = m_librarian->records();
        if (records.empty()) {
            std::cout << "No clips in the library (try 'scan')\n";
            return 0;
        }
        print_records(records);
        return 0;
    }

    int search(const std::string& keyword) {
        RecordList records = m_librarian->search(keyword);
        if (records.empty()) {
            std::cout << "No clip names contain '" << keyword << "'\n";
            return 0;
        }
        print_records(records);
        return 0;
    }

    void print_records(const RecordList& records) const {
        for (const auto& record : records) {
            std::cout << std::left << std::setw(40) << display_name(record.path) << std::right
                      << std::fixed << std::setprecision(2) << std::setw(8) << record.cached_duration << "s  "
                      << record.cached_sample_rate << " Hz  " << record.cached_channels << "ch";
            if (!record.tags.empty()) {
                std::cout << "  [" << join(record.tags.begin(), record.tags.end(), ", ") << "]";
            }
            std::cout << "\n";
        }
    }

    int info(const std::string& path) {
        MetadataRecord record = m_librarian->record(path);
        std::cout << "Path:        " << record.path << "\n";
        std::cout << "Duration:    " << std::fixed << std::setprecision(3) << record.cached_duration << " s\n";
        std::cout << "Sample rate: " << record.cached_sample_rate << " Hz\n";
        std::cout << "Channels:    " << record.cached_channels << "\n";
        std::cout << "Size:        " << record.cached_size << " bytes\n";
        std::cout << "Tags:        " << join(record.tags.begin(), record.tags.end(), ", ") << "\n";
        std::cout << "Description: " << record.description << "\n";
        return 0;
    }

    int tag(const std::string& path, const std::set<std::string>& tags) {
        MetadataRecord record = m_librarian->record(path);
        m_librarian->update_metadata(path, tags, record.description);
        std::cout << "Tagged " << display_name(path) << "\n";
        return 0;
    }

    int describe(const std::string& path, const std::string& description) {
        MetadataRecord record = m_librarian->record(path);
        m_librarian->update_metadata(path, record.tags, description);
        std::cout << "Described " << display_name(path) << "\n";
        return 0;
    }

    int find(const std::string& tag_name) {
        for (const auto& path : m_librarian->files_with_tag(tag_name)) {
            std::cout << path << "\n";
        }
        return 0;
    }

    int tags() {
        for (const auto& tag_name : m_librarian->all_tags()) {
            std::cout << tag_name << "\n";
        }
        return 0;
    }

    int waveform(const std::string& path, int width) {
        AudioFile audio = m_librarian->load(path);
        Waveform peaks = m_renderer.render(audio, width);

        // One text row per amplitude band, top row = +1.0
        for (int row = 0; row < WAVEFORM_HEIGHT; ++row) {
            const float upper = 1.0f - 2.0f * row / WAVEFORM_HEIGHT;
            const float lower = 1.0f - 2.0f * (row + 1) / WAVEFORM_HEIGHT;
            std::string line;
            line.reserve(peaks.size());
            for (const auto& peak : peaks) {
                line.push_back(peak.max >= lower && peak.min <= upper ? '#' : ' ');
            }
            std::cout << '|' << line << "|\n";
        }
        std::cout << display_name(path) << ": " << audio.frame_count() << " frames, "
                  << std::fixed << std::setprecision(3) << audio.duration() << " s\n";
        return 0;
    }

    // filter <path> lowpass|highpass <hz> <out>
    // filter <path> bandpass <low-hz> <high-hz> <out>
    int filter() {
        const auto& args = m_config.arguments;
        expect_arguments(4, 5);

        FilterSpec spec;
        spec.type = parse_filter_type(args[1]);
        const size_t expected = spec.type == FilterType::BAND_PASS ? 5 : 4;
        if (args.size() != expected) {
            throw InvalidArgument(std::string("filter ") + filter_type_name(spec.type) + " expects " +
                                  (expected == 5 ? "<path> bandpass <low-hz> <high-hz> <out>"
                                                 : "<path> <type> <hz> <out>"));
        }
        spec.cutoff_hz = parse_number(args[2], "cutoff");
        if (spec.type == FilterType::BAND_PASS) {
            spec.upper_cutoff_hz = parse_number(args[3], "upper cutoff");
        }

        AudioFile audio = m_librarian->load(resolve(args[0]));
        return save(m_editor.filter(audio, spec), args.back());
    }

    int play() {
        const auto& args = m_config.arguments;
        PlaybackDirection direction = PlaybackDirection::FORWARD;
        std::vector<std::string> positional;
        for (const auto& arg : args) {
            if (arg == "--reverse" || arg == "-r") {
                direction = PlaybackDirection::REVERSE;
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.size() != 1 && positional.size() != 3) {
            throw InvalidArgument("play expects <path> [start end] [--reverse]");
        }

        const std::string path = resolve(positional[0]);
        AudioFile audio = positional.size() == 3
            ? m_librarian->load_region(path, parse_selection(positional[1], positional[2]))
            : m_librarian->load(path);

        PlaybackOptions options;
        options.tick_interval = std::chrono::milliseconds(m_config.tick_interval_ms);
        options.volume = m_config.volume;
        PlaybackController controller(create_audio_engine(), options);

        const size_t frames = audio.frame_count();
        const int rate = audio.sample_rate;
        controller.set_progress_callback([frames, rate](size_t position) {
            std::cout << "\r" << std::fixed << std::setprecision(2)
                      << static_cast<double>(position) / rate << " / "
                      << static_cast<double>(frames) / rate << " s" << std::flush;
        });

        std::cout << "Playing " << display_name(audio.path)
                  << (direction == PlaybackDirection::REVERSE ? " (reverse)" : "") << "\n";
        controller.play(audio, direction);

        const auto timeout = std::chrono::milliseconds(
            static_cast<int64_t>(std::ceil(audio.duration() * 1000.0)) + 5000);
        if (!controller.wait_until_stopped(timeout)) {
            std::cerr << "\nPlayback: clip did not finish in time, stopping\n";
            controller.stop();
        }
        std::cout << "\n";
        return 0;
    }

    int save(const AudioFile& audio, const std::string& out_path) {
        m_editor.save(audio, out_path);
        std::cout << "Wrote " << audio.frame_count() << " frames to " << out_path << "\n";
        return 0;
    }

    void expect_arguments(size_t min_count, size_t max_count) const {
        size_t count = m_config.arguments.size();
        if (count < min_count || count > max_count) {
            throw InvalidArgument("Wrong number of arguments for '" + m_config.command +
                                  "' (see clipshelf --help)");
        }
    }

    // Relative clip paths are taken relative to the library directory when
    // they do not exist relative to the working directory.
    std::string resolve(const std::string& path) const {
        std::filesystem::path candidate(path);
        if (candidate.is_absolute() || std::filesystem::exists(candidate)) {
            return normalize_path(path);
        }
        return normalize_path((std::filesystem::path(m_config.library_dir) / candidate).string());
    }

    std::string display_name(const std::string& path) const {
        std::error_code ec;
        auto relative = std::filesystem::relative(path, normalize_path(m_config.library_dir), ec);
        if (ec || relative.empty() || *relative.begin() == "..") {
            return path;
        }
        return relative.string();
    }

    Selection parse_selection(const std::string& start, const std::string& end) const {
        return Selection{parse_count(start, "start"), parse_count(end, "end")};
    }

    static double parse_speed(const std::string& text) {
        if (text == "fast") {
            return 2.0;
        }
        if (text == "slow") {
            return 0.5;
        }
        return parse_number(text, "speed");
    }

    template <typename It>
    static std::string join(It first, It last, const std::string& separator = " ") {
        std::ostringstream out;
        for (It it = first; it != last; ++it) {
            if (it != first) {
                out << separator;
            }
            out << *it;
        }
        return out.str();
    }
};

}

int main(int argc, char* argv[]) {
    try {
        clipshelf::AppConfig config = clipshelf::parse_arguments(argc, argv);

        if (config.show_help) {
            clipshelf::print_usage();
            return 0;
        }

        clipshelf::ClipShelfApp app(std::move(config));
        return app.run();

    } catch (const clipshelf::Error& e) {
        std::cerr << "Error (" << clipshelf::error_kind_name(e.kind()) << "): " << e.what() << "\n";
        if (e.kind() == clipshelf::ErrorKind::INVALID_ARGUMENT) {
            std::cerr << "Use --help for usage information\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
