#include <timermig/core/report_writer.hpp>

#include <timermig/algo/batch.hpp>

#include <timermig/io/error.hpp>
#include <timermig/io/fact_loader.hpp>
#include <timermig/io/report_writers.hpp>
#include <timermig/io/summary.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace core = timermig::core;
namespace algo = timermig::algo;
namespace io = timermig::io;

struct Config {
    std::string input_file;
    std::string output_file{"-"};
    std::string format{"json"};
    std::size_t num_threads{0};  // 0 = hardware concurrency
    bool summary{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("timermig", "Classify EJB timer usage for Quartz migration");

    options.add_options()
        ("i,input", "Fact file (JSON)", cxxopts::value<std::string>())
        ("o,output", "Report output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("j,threads", "Worker threads (default: hardware concurrency)",
            cxxopts::value<std::size_t>()->default_value("0"))
        ("summary", "Append per-status counts to the report")
        ("v,verbose", "Verbose output")
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
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.num_threads = result["threads"].as<std::size_t>();
    config.summary = result.count("summary") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }

    return config;
}

std::unique_ptr<core::ReportWriter> make_writer(const Config& config, std::ostream& out) {
    if (config.format == "null") {
        return std::make_unique<io::NullReportWriter>();
    }
    if (config.format == "text") {
        return std::make_unique<io::TextualReportWriter>(out, config.summary);
    }
    return std::make_unique<io::JsonReportWriter>(out, config.summary);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading facts from: " << config.input_file << std::endl;
        }

        // 1. Load facts
        auto units = io::load_units(config.input_file);

        if (config.verbose) {
            std::cerr << "Classifying " << units.size() << " units..." << std::endl;
        }

        // 2. Classify
        const auto start = std::chrono::steady_clock::now();
        auto reports = algo::classify_batch(units, config.num_threads);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        // 3. Setup report writer
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.output_file != "-" && config.format != "null") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }
        auto writer = make_writer(config, *out);

        // 4. Sink reports in unit order
        for (const auto& report : reports) {
            writer->write(report);
        }
        writer->finalize();

        if (config.verbose) {
            auto summary = io::compute_summary(reports);
            std::cerr << "Classified " << summary.total << " units in "
                      << std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()
                      << "us: " << summary.automatic << " automatic, "
                      << summary.partial_automatic << " partial, "
                      << summary.manual_required << " manual" << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
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
