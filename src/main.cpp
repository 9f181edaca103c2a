#include "app_constants.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "io/reader.hpp"
#include "operator/operator.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

using OmniStore::Operator;

int ReportFailure(const OmniStore::Storage::StorageError &error)
{
    std::cerr << OmniStore::Constants::APP_NAME << ": " << error.ToString() << std::endl;
    return EXIT_FAILURE;
}

std::string FormatTime(const std::optional<std::chrono::system_clock::time_point> &time)
{
    if (!time) {
        return "-";
    }
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(*time));
}

int RunStat(Operator &op, const std::string &path)
{
    auto stat_res = op.Stat(path);
    if (!stat_res) {
        return ReportFailure(stat_res.error());
    }
    const auto &meta = *stat_res;
    std::cout << "path:          " << path << '\n'
              << "type:          " << (meta.is_directory ? "directory" : "file") << '\n'
              << "size:          " << (meta.content_length ? std::to_string(*meta.content_length) : "-") << '\n'
              << "last_modified: " << FormatTime(meta.last_modified) << '\n'
              << "etag:          " << meta.etag.value_or("-") << std::endl;
    return EXIT_SUCCESS;
}

int RunCat(Operator &op, const std::string &path, std::int64_t offset, std::optional<std::int64_t> length)
{
    auto reader = op.Read(path, offset, length);
    if (!reader) {
        return ReportFailure(reader.error());
    }

    std::vector<std::byte> buffer(OmniStore::Io::kDefaultChunkSize);
    while (true) {
        auto read_res = (*reader)->Read(buffer);
        if (!read_res) {
            return ReportFailure(read_res.error());
        }
        if (*read_res == 0) {
            break;
        }
        std::cout.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(*read_res));
    }
    std::cout.flush();
    return EXIT_SUCCESS;
}

int RunList(Operator &op, const std::string &path)
{
    auto lister = op.List(path);
    if (!lister) {
        return ReportFailure(lister.error());
    }
    while (true) {
        auto next = (*lister)->Next();
        if (!next) {
            return ReportFailure(next.error());
        }
        if (!next->has_value()) {
            break;
        }
        const auto &entry = **next;
        if (entry.metadata.is_directory) {
            std::cout << std::format("{:>12}  {}\n", "<dir>", entry.id.Str());
        } else {
            std::cout << std::format(
                "{:>12}  {}\n", entry.metadata.content_length.value_or(0), entry.id.Str()
            );
        }
    }
    std::cout.flush();
    return EXIT_SUCCESS;
}

int RunPut(Operator &op, const std::string &path, const std::string &input_file)
{
    OmniStore::Storage::StorageResult<OmniStore::Storage::ObjectMetadata> write_res;
    if (input_file.empty()) {
        OmniStore::Io::StreamReader reader(std::cin, "stdin");
        write_res = op.Write(path, reader);
    } else {
        std::ifstream input(input_file, std::ios::binary);
        if (!input) {
            std::cerr << OmniStore::Constants::APP_NAME << ": cannot open " << input_file << std::endl;
            return EXIT_FAILURE;
        }
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(input_file, ec);
        OmniStore::Io::StreamReader reader(input, input_file);
        write_res = op.Write(
            path, reader, ec ? std::nullopt : std::optional<std::uint64_t>(file_size)
        );
    }
    if (!write_res) {
        return ReportFailure(write_res.error());
    }
    spdlog::info("Wrote {} bytes to '{}'", write_res->content_length.value_or(0), path);
    return EXIT_SUCCESS;
}

}  // anonymous namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(OmniStore::Constants::APP_NAME)};
    app.require_subcommand(1);

    std::string config_path_str;
    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->required()
        ->check(CLI::ExistingFile);

    app.set_version_flag("-v,--version", std::string(OmniStore::Constants::APP_VERSION_STRING));

    std::string path;
    std::int64_t offset = 0;
    std::optional<std::int64_t> length;
    std::string input_file;

    auto *stat_cmd = app.add_subcommand("stat", "Show metadata of an object");
    stat_cmd->add_option("path", path, "Object path")->required();

    auto *cat_cmd = app.add_subcommand("cat", "Write an object's bytes to stdout");
    cat_cmd->add_option("path", path, "Object path")->required();
    cat_cmd->add_option("--offset", offset, "First byte to read")->check(CLI::NonNegativeNumber);
    cat_cmd->add_option("--length", length, "Number of bytes to read")->check(CLI::NonNegativeNumber);

    auto *ls_cmd = app.add_subcommand("ls", "List a directory");
    ls_cmd->add_option("path", path, "Directory path")->default_val("/");

    auto *put_cmd = app.add_subcommand("put", "Store stdin or a local file as an object");
    put_cmd->add_option("path", path, "Object path")->required();
    put_cmd->add_option("-f,--file", input_file, "Local file to upload instead of stdin")
        ->check(CLI::ExistingFile);

    auto *rm_cmd = app.add_subcommand("rm", "Delete an object or an empty directory");
    rm_cmd->add_option("path", path, "Object path")->required();

    auto *mkdir_cmd = app.add_subcommand("mkdir", "Create a directory");
    mkdir_cmd->add_option("path", path, "Directory path")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger before config is parsed; stdout carries data
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(OmniStore::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(OmniStore::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(OmniStore::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(OmniStore::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Load Configuration
    std::filesystem::path config_path(config_path_str);
    auto config_result = OmniStore::Config::LoadConfigFromFileVerbose(config_path);
    if (!config_result) {
        spdlog::critical("Error loading configuration: {}", config_result.error());
        return EXIT_FAILURE;
    }

    spdlog::set_level(config_result->global_settings.log_level);
    spdlog::debug(
        "Logging level set to: {}",
        spdlog::level::to_string_view(config_result->global_settings.log_level)
    );

    // Setup Core Components
    std::unique_ptr<Operator> op;
    try {
        auto op_res = Operator::FromConfig(*config_result);
        if (!op_res) {
            spdlog::critical("Error initializing operator: {}", op_res.error().ToString());
            return EXIT_FAILURE;
        }
        op = std::move(*op_res);
    } catch (const std::exception &e) {
        spdlog::critical("Error initializing components: {}", e.what());
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    if (*stat_cmd) {
        ret = RunStat(*op, path);
    } else if (*cat_cmd) {
        ret = RunCat(*op, path, offset, length);
    } else if (*ls_cmd) {
        ret = RunList(*op, path);
    } else if (*put_cmd) {
        ret = RunPut(*op, path, input_file);
    } else if (*rm_cmd) {
        auto delete_res = op->Delete(path);
        ret             = delete_res ? EXIT_SUCCESS : ReportFailure(delete_res.error());
    } else if (*mkdir_cmd) {
        auto create_res = op->CreateDir(path);
        ret             = create_res ? EXIT_SUCCESS : ReportFailure(create_res.error());
    }

    op.reset();
    spdlog::shutdown();
    return ret;
}
