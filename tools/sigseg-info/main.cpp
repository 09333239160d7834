// SPDX-FileCopyrightText: 2025 Contributors to the sigseg project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file sigseg-info/main.cpp
 * @brief Recording inspection and access pattern benchmark utility
 *
 * This tool opens a ".sigrec" recording through the sigseg C API, prints its
 * metadata and optionally dumps one segment or times a viewer access pattern.
 * It can also write a synthetic recording to get started without real data.
 *
 * Usage examples:
 *   - Show recording info:               sigseg-info -f /data/patient01.sigrec
 *   - Segment it and dump one segment:   sigseg-info -f /data/patient01.sigrec --segment-seconds 30 --segment 4
 *   - Time a random access pattern:      sigseg-info -f /data/patient01.sigrec --segment-seconds 60 --pattern random --count 5
 *   - Write a synthetic recording:       sigseg-info --generate /tmp/demo.sigrec --gen-channels 8 --gen-seconds 600
 *
 * When the SIGSEG_HOST_ROOT environment variable is set, absolute recording
 * paths are looked up below that directory (container deployments).
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <picojson/picojson.h>
#include <sigseg/sigseg.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include "sigseg-internal/PathUtils.hpp"
#include "sigseg-internal/RecordingFormat.hpp"
#include "sigseg-internal/SegmentIndexer.hpp"

namespace
{
    constexpr auto const HOST_ROOT_ENV_VAR = "SIGSEG_HOST_ROOT";
    constexpr auto const PI = 3.14159265358979323846;

    /**
     * @brief RAII wrapper for sigseg instance lifecycle management
     *
     * The instance is shut down and destroyed when the object goes out of scope.
     */
    class ScopedSigsegInstance
    {
    public:
        /**
         * @brief Construct and initialize a sigseg instance
         * @param options JSON options forwarded to sigsegCreateInstance()
         * @throws std::runtime_error if instance creation fails
         */
        explicit ScopedSigsegInstance(std::string const& options)
            : _instance{::sigsegCreateInstance(options.c_str())}
        {
            if (_instance == nullptr)
            {
                throw std::runtime_error{"Failed to create sigseg instance."};
            }
        }

        ScopedSigsegInstance(ScopedSigsegInstance&&) = delete;
        ScopedSigsegInstance(ScopedSigsegInstance const&) = delete;

        ScopedSigsegInstance& operator=(ScopedSigsegInstance&&) = delete;
        ScopedSigsegInstance& operator=(ScopedSigsegInstance const&) = delete;

        ~ScopedSigsegInstance()
        {
            // Guaranteed to be non-null if the destructor runs
            ::sigsegDestroyInstance(_instance);
        }

        constexpr operator ::sigsegInstance() const noexcept
        {
            return _instance;
        }

    private:
        ::sigsegInstance _instance;
    };

    /** Releases a segment handle on scope exit. */
    struct SegmentDeleter
    {
        void operator()(::sigsegSegment_t* segment) const noexcept
        {
            ::sigsegReleaseSegment(segment);
        }
    };

    using ScopedSegment = std::unique_ptr<::sigsegSegment_t, SegmentDeleter>;

    char const* statusName(::sigsegStatus status) noexcept
    {
        switch (status)
        {
            case SIGSEG_STATUS_OK:            return "ok";
            case SIGSEG_ERR_OPEN:             return "cannot open recording";
            case SIGSEG_ERR_NOT_OPEN:         return "recording not open";
            case SIGSEG_ERR_NOT_SEGMENTED:    return "no segment length configured";
            case SIGSEG_ERR_INVALID_ARG:      return "invalid argument";
            case SIGSEG_ERR_OUT_OF_RANGE:     return "segment index out of range";
            case SIGSEG_ERR_READ:             return "read failure";
            case SIGSEG_ERR_INVALID_INSTANCE: return "invalid instance";
            case SIGSEG_ERR_BUFFER_TOO_SMALL: return "buffer too small";
            default:                          return "unknown error";
        }
    }

    void check(::sigsegStatus status, std::string const& what)
    {
        if (status != SIGSEG_STATUS_OK)
        {
            throw std::runtime_error{fmt::format("{}: {}", what, statusName(status))};
        }
    }

    /**
     * @brief Install a console sink and a timestamped log file as the default logger
     *
     * The file is named server_<YYYY-mm-ddTHH-MM-SS>.log and placed in @p logDir.
     */
    void setupLogging(std::string const& logDir, std::string const& level)
    {
        auto sinks = std::vector<spdlog::sink_ptr>{};
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!logDir.empty())
        {
            std::filesystem::create_directories(logDir);
            auto const file = std::filesystem::path{logDir} / fmt::format("server_{:%Y-%m-%dT%H-%M-%S}.log", fmt::localtime(std::time(nullptr)));
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string()));
        }

        auto logger = std::make_shared<spdlog::logger>("sigseg", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [thread %t] %v");
        logger->set_level(spdlog::level::from_str(level));
        spdlog::set_default_logger(std::move(logger));
    }

    /**
     * @brief Fetch the recording metadata JSON using the required size protocol
     */
    picojson::object getFileInfo(::sigsegInstance instance, std::string const& path)
    {
        auto size = std::size_t{0};
        if (auto const status = ::sigsegGetFileInfo(instance, path.c_str(), nullptr, &size); status != SIGSEG_ERR_BUFFER_TOO_SMALL)
        {
            check(status, "Failed to get file info");
        }

        auto buffer = std::vector<char>(size);
        check(::sigsegGetFileInfo(instance, path.c_str(), buffer.data(), &size), "Failed to get file info");

        auto v = picojson::value{};
        if (auto const errorString = picojson::parse(v, std::string{buffer.data()}); !errorString.empty() || !v.is<picojson::object>())
        {
            throw std::runtime_error{"Malformed file info."};
        }
        return v.get<picojson::object>();
    }

    void printFileInfo(std::ostream& out, picojson::object const& info)
    {
        auto const& bounds = info.at("timeBounds").get<picojson::object>();

        out << fmt::format("- Recording {}", info.at("path").get<std::string>()) << '\n'
            << fmt::format("\t{: >20}: {}", "Start", sigseg::lib::formatTimestamp(std::llround(bounds.at("start").get<double>()))) << '\n'
            << fmt::format("\t{: >20}: {}", "End", sigseg::lib::formatTimestamp(std::llround(bounds.at("end").get<double>()))) << '\n'
            << fmt::format("\t{: >20}: {:.3f} s", "Duration", bounds.at("durationSeconds").get<double>()) << '\n'
            << fmt::format("\t{: >20}: {} s", "Segment length", info.at("segmentSeconds").get<double>()) << '\n'
            << fmt::format("\t{: >20}: {}", "Segments", info.at("segmentCount").get<double>()) << '\n'
            << fmt::format("\t{: >20}: {}", "Generation", info.at("generation").get<double>()) << '\n';

        auto active = std::vector<std::string>{};
        for (auto const& name : info.at("activeChannels").get<picojson::array>())
        {
            active.push_back(name.get<std::string>());
        }

        out << fmt::format("\t{: >20}:", "Channels") << '\n';
        for (auto const& channel : info.at("channels").get<picojson::array>())
        {
            auto const& c = channel.get<picojson::object>();
            auto const& name = c.at("name").get<std::string>();
            auto const isActive = std::find(active.begin(), active.end(), name) != active.end();
            out << fmt::format("\t{: >20}  {: <12} {:>10.3f} Hz {:>12} samples{}",
                       "",
                       name,
                       c.at("samplingRate").get<double>(),
                       c.at("sampleCount").get<double>(),
                       isActive ? "" : "  (inactive)")
                << '\n';
        }
    }

    void printSegment(::sigsegInstance instance, std::string const& path, std::int64_t index)
    {
        auto handle = ::sigsegSegment{};
        check(::sigsegGetSegment(instance, path.c_str(), index, &handle), fmt::format("Failed to read segment {}", index));
        auto const segment = ScopedSegment{handle};

        auto channels = std::size_t{0};
        check(::sigsegSegmentGetChannelCount(segment.get(), &channels), "Failed to inspect segment");

        std::cout << fmt::format("- Segment {}", index) << '\n';
        for (auto i = std::size_t{0}; i < channels; ++i)
        {
            double const* samples = nullptr;
            auto count = std::size_t{0};
            check(::sigsegSegmentGetChannel(segment.get(), i, &samples, &count), "Failed to access channel");

            auto valid = std::size_t{0};
            auto minimum = std::numeric_limits<double>::infinity();
            auto maximum = -std::numeric_limits<double>::infinity();
            for (auto k = std::size_t{0}; k < count; ++k)
            {
                if (!std::isnan(samples[k]))
                {
                    ++valid;
                    minimum = std::min(minimum, samples[k]);
                    maximum = std::max(maximum, samples[k]);
                }
            }

            if (valid == 0)
            {
                std::cout << fmt::format("\t{: >4}: {:>8} samples, no coverage", i, count) << '\n';
            }
            else
            {
                std::cout << fmt::format("\t{: >4}: {:>8} samples, {:>8} valid, min {:.6g}, max {:.6g}", i, count, valid, minimum, maximum)
                          << '\n';
            }
        }
    }

    std::vector<std::int64_t> makePattern(std::string const& name, std::int64_t segmentCount)
    {
        auto order = std::vector<std::int64_t>(static_cast<std::size_t>(segmentCount));
        std::iota(order.begin(), order.end(), 0);

        if (name == "backward")
        {
            std::reverse(order.begin(), order.end());
        }
        else if (name == "random")
        {
            auto engine = std::mt19937{42};
            std::shuffle(order.begin(), order.end(), engine);
        }
        else if (name == "back-and-forth")
        {
            // Page forward through the first half, then back to the start.
            order.resize(static_cast<std::size_t>((segmentCount + 1) / 2));
            auto back = order;
            std::reverse(back.begin(), back.end());
            order.insert(order.end(), back.begin(), back.end());
        }
        return order;
    }

    /**
     * @brief Time repeated walks of an access pattern over all segments
     *
     * The file is closed and reopened before every run so each run starts cold.
     */
    void benchmark(::sigsegInstance instance, std::string const& path, double segmentSeconds, std::string const& pattern, unsigned count)
    {
        auto segments = std::uint64_t{0};
        check(::sigsegGetNumberOfSegments(instance, path.c_str(), &segments), "Failed to count segments");
        auto const order = makePattern(pattern, static_cast<std::int64_t>(segments));

        auto total = std::chrono::duration<double, std::milli>{0};
        for (auto run = 0U; run < count; ++run)
        {
            check(::sigsegCloseFile(instance, path.c_str()), "Failed to close recording");
            check(::sigsegOpenFile(instance, path.c_str()), "Failed to open recording");
            check(::sigsegSetSegmentSeconds(instance, path.c_str(), segmentSeconds, nullptr), "Failed to set segment length");

            auto const start = std::chrono::steady_clock::now();
            for (auto const index : order)
            {
                auto handle = ::sigsegSegment{};
                check(::sigsegGetSegment(instance, path.c_str(), index, &handle), fmt::format("Failed to read segment {}", index));
                check(::sigsegReleaseSegment(handle), "Failed to release segment");
            }
            auto const elapsed = std::chrono::duration<double, std::milli>{std::chrono::steady_clock::now() - start};
            total += elapsed;

            std::cout << fmt::format("\t{: >20}: run {} took {:.2f} ms for {} segments", pattern, run + 1, elapsed.count(), order.size())
                      << '\n';
        }

        auto const mean = (count > 0) ? total.count() / count : 0.0;
        if (::isatty(::fileno(stdout)) != 0)
        {
            std::cout << fmt::format(fmt::fg(fmt::color::green), "\t{: >20}: {:.2f} ms per pattern", pattern, mean) << '\n';
        }
        else
        {
            std::cout << fmt::format("\t{: >20}: {:.2f} ms per pattern", pattern, mean) << '\n';
        }
    }

    /**
     * @brief Write a synthetic recording of sine waves with a little noise
     */
    int generate(std::string const& directory, std::size_t channels, double seconds, double rate)
    {
        auto const sampleCount = static_cast<std::size_t>(std::llround(seconds * rate));
        auto engine = std::mt19937{7};
        auto noise = std::normal_distribution<double>{0.0, 0.05};

        auto const now = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
        auto data = std::vector<sigseg::lib::ChannelSamples>{};
        for (auto c = std::size_t{0}; c < channels; ++c)
        {
            auto samples = std::vector<double>(sampleCount);
            auto const frequency = 1.0 + static_cast<double>(c);
            for (auto i = std::size_t{0}; i < sampleCount; ++i)
            {
                samples[i] = std::sin(2.0 * PI * frequency * static_cast<double>(i) / rate) + noise(engine);
            }
            data.push_back(sigseg::lib::ChannelSamples{fmt::format("ch{}", c), rate, static_cast<std::int64_t>(now), std::move(samples)});
        }

        sigseg::lib::writeRecording(directory, data);
        std::cout << fmt::format("Wrote {} channels of {} s at {} Hz to {}", channels, seconds, rate, directory) << '\n';
        return EXIT_SUCCESS;
    }

    std::string makeOptions(unsigned prefetch, unsigned multiplier, unsigned workers)
    {
        auto root = picojson::object{};
        root["prefetchDepth"] = picojson::value{static_cast<double>(prefetch)};
        root["cacheCapacityMultiplier"] = picojson::value{static_cast<double>(multiplier)};
        root["workerCount"] = picojson::value{static_cast<double>(workers)};
        return picojson::value{std::move(root)}.serialize();
    }
}

/**
 * @brief Main entry point for sigseg-info utility
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return EXIT_SUCCESS or EXIT_FAILURE
 */
int main(int argc, char** argv)
{
    auto app = CLI::App{"sigseg-info"};

    auto version = ::sigsegVersionType{};
    ::sigsegGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto file = std::string{};
    app.add_option("-f,--file", file, "The recording directory to inspect");

    auto segmentSeconds = 0.0;
    auto segmentSecondsOpt = app.add_option("--segment-seconds", segmentSeconds, "Segment length in seconds");
    segmentSecondsOpt->check(CLI::PositiveNumber);

    auto channels = std::vector<std::string>{};
    app.add_option("--channels", channels, "Active channels, in order")->expected(1, -1);

    auto segmentIndex = std::int64_t{0};
    auto segmentOpt = app.add_option("--segment", segmentIndex, "Index of a segment to summarize");

    auto pattern = std::string{};
    auto patternOpt = app.add_option("--pattern", pattern, "Time an access pattern over all segments");
    patternOpt->check(CLI::IsMember({"forward", "backward", "random", "back-and-forth"}));

    auto count = 3U;
    app.add_option("--count", count, "Number of timed runs per pattern")->check(CLI::PositiveNumber);

    auto prefetch = 3U;
    app.add_option("--prefetch", prefetch, "Segments read ahead per served segment");
    auto multiplier = 5U;
    app.add_option("--multiplier", multiplier, "Cache capacity multiplier");
    auto workers = 4U;
    app.add_option("--workers", workers, "Prefetch worker threads");

    auto logDir = std::string{};
    app.add_option("--log-dir", logDir, "Also write a timestamped log file into this directory");
    auto logLevel = std::string{"warn"};
    app.add_option("--log-level", logLevel, "Log level")->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    auto generateDir = std::string{};
    auto generateOpt = app.add_option("--generate", generateDir, "Write a synthetic recording to this directory and exit");
    auto genChannels = std::size_t{4};
    app.add_option("--gen-channels", genChannels, "Channels of the synthetic recording")->check(CLI::PositiveNumber);
    auto genSeconds = 600.0;
    app.add_option("--gen-seconds", genSeconds, "Duration of the synthetic recording")->check(CLI::PositiveNumber);
    auto genRate = 256.0;
    app.add_option("--gen-rate", genRate, "Sampling rate of the synthetic recording")->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    try
    {
        setupLogging(logDir, logLevel);

        if (generateOpt->count() > 0)
        {
            return generate(generateDir, genChannels, genSeconds, genRate);
        }

        if (file.empty())
        {
            std::cerr << "ERROR: A recording must be specified with --file." << std::endl;
            return EXIT_FAILURE;
        }

        auto const* hostRoot = std::getenv(HOST_ROOT_ENV_VAR);
        auto const path = sigseg::lib::remapHostPath(file, (hostRoot != nullptr) ? hostRoot : "");

        auto const instance = ScopedSigsegInstance{makeOptions(prefetch, multiplier, workers)};
        check(::sigsegOpenFile(instance, path.c_str()), fmt::format("Failed to open '{}'", path));

        if (!channels.empty())
        {
            auto names = std::vector<char const*>{};
            for (auto const& name : channels)
            {
                names.push_back(name.c_str());
            }
            check(::sigsegSetActiveChannels(instance, path.c_str(), names.data(), names.size()), "Failed to select channels");
        }

        if (segmentSecondsOpt->count() > 0)
        {
            check(::sigsegSetSegmentSeconds(instance, path.c_str(), segmentSeconds, nullptr), "Failed to set segment length");
        }

        printFileInfo(std::cout, getFileInfo(instance, path));

        if (segmentOpt->count() > 0)
        {
            printSegment(instance, path, segmentIndex);
        }

        if (patternOpt->count() > 0)
        {
            if (segmentSecondsOpt->count() == 0)
            {
                std::cerr << "ERROR: --pattern needs --segment-seconds." << std::endl;
                return EXIT_FAILURE;
            }
            benchmark(instance, path, segmentSeconds, pattern, count);
        }
    }
    catch (std::exception const& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
