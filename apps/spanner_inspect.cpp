#include <spanner/core/error.hpp>
#include <spanner/core/event.hpp>
#include <spanner/core/event_manager.hpp>
#include <spanner/core/level.hpp>
#include <spanner/core/log.hpp>
#include <spanner/core/types.hpp>

#include <spanner/io/io.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace core = spanner::core;
namespace io = spanner::io;

struct Config {
    std::string input_file;
    std::optional<std::string> config_file;
    core::SearchCriteria criteria;
    std::optional<std::size_t> recent;
    bool summary{false};
    bool context{false};
    std::optional<std::string> output_file;
    std::optional<std::string> description;
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("spanner_inspect", "Inspect and filter captured event snapshots");

    options.add_options()
        ("i,input", "Snapshot file (JSON)", cxxopts::value<std::string>())
        ("c,config", "Configuration file (JSON)", cxxopts::value<std::string>())
        ("l,level", "Only events at this level (TRACE|DEBUG|INFO|WARN|ERROR)", cxxopts::value<std::string>())
        ("t,target", "Only events whose target contains this text", cxxopts::value<std::string>())
        ("m,message", "Only events whose message contains this text",
            cxxopts::value<std::string>())
        ("s,span", "Only events with a span of this name on their stack", cxxopts::value<std::string>())
        ("n,recent", "Keep only the first N matches in snapshot order (the N most recent for exported snapshots)", cxxopts::value<std::size_t>())
        ("summary", "Print per-level counts of the matching events")
        ("context", "Print the full context of each matching event")
        ("o,output", "Write the matching events to a new snapshot", cxxopts::value<std::string>())
        ("description", "Description stored in the written snapshot", cxxopts::value<std::string>())
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.input_file = result["input"].as<std::string>();
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    if (result.count("level") != 0U) {
        auto label = result["level"].as<std::string>();
        config.criteria.level = core::level_from_string(label);
        if (!config.criteria.level) {
            throw std::invalid_argument("unknown level '" + label + "'");
        }
    }
    if (result.count("target") != 0U) {
        config.criteria.target = result["target"].as<std::string>();
    }
    if (result.count("message") != 0U) {
        config.criteria.message = result["message"].as<std::string>();
    }
    if (result.count("span") != 0U) {
        config.criteria.span_name = result["span"].as<std::string>();
    }
    if (result.count("recent") != 0U) {
        config.recent = result["recent"].as<std::size_t>();
    }
    config.summary = result.count("summary") != 0U;
    config.context = result.count("context") != 0U;
    if (result.count("output") != 0U) {
        config.output_file = result["output"].as<std::string>();
    }
    if (result.count("description") != 0U) {
        config.description = result["description"].as<std::string>();
    }

    return config;
}

void print_event(const core::Event& event, bool full) {
    if (full) {
        std::cout << event.full_context() << "\n\n";
        return;
    }
    const auto& data = event.data();
    std::cout << core::format_timestamp(data.timestamp()) << " " << core::to_string(data.level()) << " "
              << data.target() << ": " << data.message() << "\n";
}

void print_summary(const std::vector<core::Event>& events) {
    core::EventManager selection(events.size());
    for (const auto& event : events) {
        selection.push(event);
    }
    std::cout << selection.summary();
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        std::optional<std::string> default_description;
        if (config.config_file) {
            auto settings = io::load_config(*config.config_file);
            core::configure_logging(io::parse_log_level(settings.log_level), settings.log_file);
            default_description = settings.export_description;
        }

        // 1. Read the whole snapshot; no store capacity applies
        auto data = io::read_snapshot(config.input_file);

        // 2. Filter in document order. Exported snapshots list the store
        // newest first, so the first N matches are the N most recent.
        std::vector<core::Event> matches;
        for (auto& event : data.events) {
            if (config.recent && matches.size() >= *config.recent) {
                break;
            }
            if (event.matches(config.criteria)) {
                matches.push_back(std::move(event));
            }
        }

        // 3. Report
        if (config.summary) {
            print_summary(matches);
        } else {
            for (const auto& event : matches) {
                print_event(event, config.context);
            }
        }

        // 4. Optional re-export of the selection
        if (config.output_file) {
            auto description = config.description ? config.description : default_description;
            auto selection = io::create_export_data(std::move(matches), std::move(description));
            io::write_snapshot(selection, *config.output_file);
            std::cerr << "Wrote " << selection.events.size() << " events to " << *config.output_file << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Snapshot error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
