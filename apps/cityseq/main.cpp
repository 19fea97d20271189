#include "conv/obj_writer.h"
#include "core/error.h"
#include "core/model/city_document.h"
#include "core/seq/merge_engine.h"
#include "core/seq/settings.h"
#include "core/seq/split_engine.h"
#include "core/seq/stream_filter.h"
#include "log.h"

#include <argh.h>
#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace CitySeq;
using namespace CitySeq::Core;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Thrown for command-line mistakes; mapped to exit code 2.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void printHelp(const std::string& program) {
    std::cerr << fmt::format(
        "Usage: {0} [--verbose|--quiet] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  cat     [-f FILE] [--order insertion|alphabetical]   CityJSON -> CityJSONSeq\n"
        "  collect [-f FILE] [FILE ...]                         CityJSONSeq -> CityJSON\n"
        "  filter  (--bbox MINX MINY MAXX MAXY | --radius X Y R | --cotype TYPE | --random N)\n"
        "          [--exclude] [--seed S] [-f FILE]             filter a CityJSONSeq\n"
        "  obj     [-f FILE] [--seq]                            CityJSON(Seq) -> OBJ\n"
        "\n"
        "Input is read from stdin unless -f is given; output goes to stdout.\n",
        program);
}

void setupLogging(const argh::parser& cmdl) {
    auto logger = spdlog::stderr_color_mt("cityseq");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    if (cmdl[{"-v", "--verbose"}]) {
        spdlog::set_level(spdlog::level::debug);
    } else if (cmdl[{"-q", "--quiet"}]) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::cfg::load_env_levels();
}

std::string readAll(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw SeqError(ErrorKind::Io, "failed to read input");
    }
    return buffer.str();
}

std::unique_ptr<std::ifstream> openFile(const std::string& path) {
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        throw SeqError(ErrorKind::Io, fmt::format("cannot open \"{}\"", path));
    }
    return file;
}

// Positional arguments after the command name.
std::vector<std::string> commandArgs(const argh::parser& cmdl) {
    const auto& pos = cmdl.pos_args();
    if (pos.size() <= 2) {
        return {};
    }
    return std::vector<std::string>(pos.begin() + 2, pos.end());
}

double toNumber(const std::string& text, const char* option) {
    std::istringstream iss(text);
    double value = 0.0;
    if (!(iss >> value) || !iss.eof()) {
        throw UsageError(fmt::format("{} expects numbers, got \"{}\"", option, text));
    }
    return value;
}

Model::CityDocument readDocument(const argh::parser& cmdl) {
    std::string path;
    if (cmdl({"-f", "--file"}) >> path) {
        auto file = openFile(path);
        return Model::CityDocument::parse(readAll(*file));
    }
    return Model::CityDocument::parse(readAll(std::cin));
}

int runCat(const argh::parser& cmdl) {
    Seq::SplitSettings settings;
    std::string order;
    if (cmdl("--order") >> order) {
        try {
            settings.order = Model::sortingStrategyFromString(order);
        } catch (const SeqError& e) {
            throw UsageError(e.detail());
        }
    }
    Model::CityDocument document = readDocument(cmdl);
    Seq::SplitEngine engine(document, settings);
    engine.write(std::cout);
    return EXIT_SUCCESS;
}

Model::CityDocument collectInputs(const argh::parser& cmdl) {
    std::vector<std::string> paths;
    std::string path;
    if (cmdl({"-f", "--file"}) >> path) {
        paths.push_back(path);
    }
    for (const auto& extra : commandArgs(cmdl)) {
        paths.push_back(extra);
    }

    std::vector<std::unique_ptr<std::ifstream>> files;
    std::vector<std::istream*> inputs;
    for (const auto& p : paths) {
        files.push_back(openFile(p));
        inputs.push_back(files.back().get());
    }
    if (inputs.empty()) {
        inputs.push_back(&std::cin);
    }
    return Seq::collect(inputs, Seq::MergeSettings());
}

int runCollect(const argh::parser& cmdl) {
    Model::CityDocument document = collectInputs(cmdl);
    std::cout << document.dump() << '\n';
    if (!std::cout) {
        throw SeqError(ErrorKind::Io, "failed to write CityJSON output");
    }
    return EXIT_SUCCESS;
}

Seq::FilterSettings filterSettings(const argh::parser& cmdl) {
    Seq::FilterSettings settings;
    std::vector<std::string> args = commandArgs(cmdl);
    int selected = 0;

    if (cmdl["--bbox"]) {
        if (args.size() != 4) {
            throw UsageError("--bbox expects MINX MINY MAXX MAXY");
        }
        settings.kind = Seq::FilterKind::BBox;
        for (std::size_t i = 0; i < 4; ++i) {
            settings.bbox[i] = toNumber(args[i], "--bbox");
        }
        ++selected;
    }
    if (cmdl["--radius"]) {
        if (args.size() != 3) {
            throw UsageError("--radius expects X Y R");
        }
        settings.kind = Seq::FilterKind::Radius;
        settings.centerX = toNumber(args[0], "--radius");
        settings.centerY = toNumber(args[1], "--radius");
        settings.radius = toNumber(args[2], "--radius");
        ++selected;
    }
    if (cmdl("--cotype") >> settings.cityObjectType) {
        settings.kind = Seq::FilterKind::CityObjectType;
        ++selected;
    }
    if (cmdl("--random")) {
        std::string factor;
        if (!(cmdl("--random") >> factor)) {
            throw UsageError("--random expects a positive integer");
        }
        try {
            settings.randomFactor = Seq::parseRandomFactor(factor);
        } catch (const SeqError& e) {
            throw UsageError(e.detail());
        }
        settings.kind = Seq::FilterKind::Random;
        ++selected;
    }
    if (selected != 1) {
        throw UsageError("filter needs exactly one of --bbox, --radius, --cotype, --random");
    }

    std::uint64_t seed = 0;
    if (cmdl("--seed")) {
        if (!(cmdl("--seed") >> seed)) {
            throw UsageError("--seed expects an unsigned integer");
        }
        settings.seed = seed;
    }
    settings.exclude = cmdl["--exclude"];
    return settings;
}

int runFilter(const argh::parser& cmdl) {
    Seq::FilterSettings settings = filterSettings(cmdl);
    std::unique_ptr<Seq::StreamFilter> filter;
    try {
        filter = Seq::makeFilter(settings);
    } catch (const SeqError& e) {
        throw UsageError(e.detail());
    }

    std::string path;
    if (cmdl({"-f", "--file"}) >> path) {
        auto file = openFile(path);
        Seq::runFilter(*file, std::cout, *filter, settings.exclude);
    } else {
        Seq::runFilter(std::cin, std::cout, *filter, settings.exclude);
    }
    return EXIT_SUCCESS;
}

int runObj(const argh::parser& cmdl) {
    Model::CityDocument document = cmdl["--seq"] ? collectInputs(cmdl) : readDocument(cmdl);
    Conv::writeObj(document, std::cout);
    return EXIT_SUCCESS;
}

}

int main(int argc, const char* argv[]) {
    auto cmdl = argh::parser({"-f", "--file", "--order", "--cotype", "--random", "--seed"});
    cmdl.parse(argc, argv);
    std::string program = cmdl[0];

    if (cmdl[{"-h", "--help"}]) {
        printHelp(program);
        return EXIT_SUCCESS;
    }
    setupLogging(cmdl);

    std::string command;
    if (!(cmdl(1) >> command)) {
        printHelp(program);
        return kExitUsage;
    }

    try {
        if (command == "cat") {
            return runCat(cmdl);
        }
        if (command == "collect") {
            return runCollect(cmdl);
        }
        if (command == "filter") {
            return runFilter(cmdl);
        }
        if (command == "obj") {
            return runObj(cmdl);
        }
        LOG_E("unknown command \"%s\"", command.c_str());
        printHelp(program);
        return kExitUsage;
    } catch (const UsageError& e) {
        LOG_E("%s", e.what());
        printHelp(program);
        return kExitUsage;
    } catch (const SeqError& e) {
        LOG_E("%s", e.what());
        return kExitFailure;
    }
}
