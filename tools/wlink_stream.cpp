// SPDX-FileCopyrightText: (c) 2025 wlink contributors
//
// SPDX-License-Identifier: Apache-2.0
#include <cxxopts.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logger.hpp"
#include "wlink/bridge/runtime_context.hpp"
#include "wlink/bridge/worker_bridge.hpp"
#include "wlink/config/bridge_config.hpp"
#include "wlink/config/task_configuration.hpp"
#include "wlink/utils/exceptions.hpp"

using namespace wlink;

namespace {

// One record per input line, read lazily.
class LineRecordIterator : public RecordIterator {
public:
    explicit LineRecordIterator(std::istream& input) : input_(input) {}

    bool has_next() override {
        if (!pending_) {
            std::string line;
            if (std::getline(input_, line)) {
                pending_ = std::move(line);
            }
        }
        return pending_.has_value();
    }

    Record next() override {
        has_next();
        Record record = to_record(pending_.value());
        pending_.reset();
        return record;
    }

private:
    std::istream& input_;
    std::optional<std::string> pending_;
};

class LinePrinter : public Collector {
public:
    void collect(Record record) override { std::cout << to_string(record) << '\n'; }
};

std::vector<Record> read_lines(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open broadcast file " + path.string());
    }
    std::vector<Record> records;
    std::string line;
    while (std::getline(file, line)) {
        records.push_back(to_record(line));
    }
    return records;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("wlink_stream", "Stream lines through an external worker and print its results.");

    options.add_options()("p,plan-dir", "Directory holding the worker plan.", cxxopts::value<std::string>())(
        "i,input", "Input file, one record per line. Reads stdin if omitted.", cxxopts::value<std::string>())(
        "c,config", "Bridge configuration yaml file.", cxxopts::value<std::string>())(
        "w,worker", "Worker binary, overrides the configured interpreter.", cxxopts::value<std::string>())(
        "python3", "Use the python3 binary.")("d,debug", "Wait for a manually started worker.")(
        "id", "Bridge id.", cxxopts::value<int>()->default_value("0"))(
        "b,broadcast",
        "Broadcast variable as name=file, one element per line. Can be repeated.",
        cxxopts::value<std::vector<std::string>>())(
        "a,arg", "Argument passed to the plan. Can be repeated.", cxxopts::value<std::vector<std::string>>())(
        "h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    if (!result.count("plan-dir")) {
        std::cerr << "--plan-dir is required" << std::endl << options.help() << std::endl;
        return 2;
    }

    try {
        BridgeConfig config = result.count("config")
                                  ? BridgeConfig::create_from_yaml(result["config"].as<std::string>())
                                  : BridgeConfig();
        config.apply_env_overrides();
        if (result.count("python3")) {
            config.use_python3 = true;
        }
        if (result.count("debug")) {
            config.debug = true;
        }
        if (result.count("worker")) {
            (config.use_python3 ? config.python3_binary : config.python2_binary) = result["worker"].as<std::string>();
        }
        if (result.count("arg")) {
            config.plan_arguments = result["arg"].as<std::vector<std::string>>();
        }

        LocalRuntimeContext context("wlink_stream", 0, result["plan-dir"].as<std::string>());
        TaskConfiguration task_config;
        if (result.count("broadcast")) {
            for (const std::string& entry : result["broadcast"].as<std::vector<std::string>>()) {
                const auto separator = entry.find('=');
                if (separator == std::string::npos || separator == 0) {
                    std::cerr << "Invalid broadcast variable '" << entry << "', expected name=file" << std::endl;
                    return 2;
                }
                const std::string name = entry.substr(0, separator);
                context.set_broadcast_variable(name, read_lines(entry.substr(separator + 1)));
                task_config.add_broadcast_variable(name);
            }
        }

        std::ifstream input_file;
        if (result.count("input")) {
            input_file.open(result["input"].as<std::string>());
            if (!input_file.is_open()) {
                std::cerr << "Failed to open input file: " << result["input"].as<std::string>() << std::endl;
                return 1;
            }
        }
        LineRecordIterator source(input_file.is_open() ? static_cast<std::istream&>(input_file) : std::cin);
        LinePrinter sink;

        WorkerBridge bridge(context, result["id"].as<int>(), config);
        bridge.open();
        bridge.send_broadcast_variables(task_config);
        bridge.stream_without_groups(source, sink);
        bridge.close();
        std::cout.flush();
    } catch (const BridgeError& e) {
        WLINK_ERROR("Worker failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        WLINK_ERROR("{}", e.what());
        return 1;
    }

    return 0;
}
