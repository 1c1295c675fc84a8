// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>

#include "depmap/commands.hpp"
#include "depmap/errors.hpp"
#include "depmap/version.hpp"

using namespace depmap;

void print_banner() {
    std::cout << "depmap v" << VERSION_STRING
              << " - dependency graph and impact analysis for source trees\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options("depmap", "Dependency graph and impact analysis for Python, C, C++, "
                                       "JavaScript, TypeScript, Rust, Go and Java code");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("sync", "Scan the source tree and update the dependency graph");
    opts("j,jobs", "Number of scan threads (0 = auto)", cxxopts::value<unsigned int>());
    opts("root", "Root directory to sync", cxxopts::value<std::string>()->default_value("."));
    opts("config", "Configuration file", cxxopts::value<std::string>());
    opts("store", "Store file", cxxopts::value<std::string>());
    opts("log-level", "error, warn, info or debug", cxxopts::value<std::string>());
    opts("json", "Machine-readable output");

    opts("cycles", "List dependency cycles");
    opts("impact", "List what transitively depends on a symbol", cxxopts::value<std::string>());
    opts("depth", "Maximum depth for --impact", cxxopts::value<size_t>());
    opts("symbols", "List symbols defined in a file", cxxopts::value<std::string>());
    opts("orphans", "List callables nothing refers to");
    opts("dynamic", "List edges whose target is not statically known");
    opts("search", "Search symbols by name", cxxopts::value<std::string>());
    opts("stats", "Print graph statistics");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  depmap --sync                      Sync the current directory"
                      << std::endl;
            std::cout << "  depmap --sync -j 8 --root src      Sync src/ using 8 threads"
                      << std::endl;
            std::cout << "  depmap --cycles                    List dependency cycles"
                      << std::endl;
            std::cout << "  depmap --impact parse --depth 3    Who depends on parse, 3 levels"
                      << std::endl;
            std::cout << "  depmap --symbols src/app.py        Symbols defined in a file"
                      << std::endl;
            std::cout << "  depmap --dynamic --json            Uncertain edges as JSON"
                      << std::endl;
            return STATUS_OK;
        }

        if (result.count("version")) {
            std::cout << "depmap v" << VERSION_STRING << std::endl;
            return STATUS_OK;
        }

        // Configuration file, then command-line overrides
        CliContext ctx;
        if (result.count("config")) {
            ctx.config = EngineConfig::load(result["config"].as<std::string>());
        } else if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
            ctx.config = EngineConfig::load(DEFAULT_CONFIG_FILE);
        }
        if (result.count("jobs"))
            ctx.config.num_threads = result["jobs"].as<unsigned int>();
        if (result.count("store"))
            ctx.config.store_path = result["store"].as<std::string>();
        if (result.count("log-level"))
            ctx.config.log_level = log_level_from_string(result["log-level"].as<std::string>());
        ctx.json_output = result.count("json") > 0;

        if (result.count("sync")) {
            return cmd_sync(ctx, result["root"].as<std::string>());
        }

        if (result.count("cycles")) {
            return cmd_cycles(ctx);
        }

        if (result.count("impact")) {
            std::optional<size_t> depth;
            if (result.count("depth"))
                depth = result["depth"].as<size_t>();
            return cmd_impact(ctx, result["impact"].as<std::string>(), depth);
        }

        if (result.count("symbols")) {
            return cmd_symbols(ctx, result["symbols"].as<std::string>());
        }

        if (result.count("orphans")) {
            return cmd_orphans(ctx);
        }

        if (result.count("dynamic")) {
            return cmd_dynamic(ctx);
        }

        if (result.count("search")) {
            return cmd_search(ctx, result["search"].as<std::string>());
        }

        if (result.count("stats")) {
            return cmd_stats(ctx);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return STATUS_OK;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return STATUS_ERROR;
    } catch (const ConfigError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return STATUS_ERROR;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return STATUS_ERROR;
    }
}
