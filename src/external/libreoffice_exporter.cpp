/**
 * @file    libreoffice_exporter.cpp
 * @brief   Document export through LibreOffice headless mode
 * @license MIT
 */

#include "external/external_tools.hpp"
#include "external/process_runner.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <vector>

namespace fs = std::filesystem;

namespace nxc::external {

namespace {

// Extension of the uploaded file, if it is a plain token
std::string input_extension(std::string_view original_name) {
    std::string ext = fs::path(std::string(original_name)).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext.size() < 2 || !is_format_token(std::string_view(ext).substr(1))) {
        if (!ext.empty()) {
            spdlog::debug("Ignoring unusual document extension: {}", ext);
        }
        return {};
    }
    return ext;
}

bool is_filter_name(std::string_view filter) noexcept {
    if (filter.empty() || filter.size() > 64) return false;
    for (char c : filter) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == ' ';
        if (!ok) return false;
    }
    return true;
}

}  // anonymous namespace

LibreOfficeExporter::LibreOfficeExporter(std::string executable, const TempWorkspace& workspace)
    : executable_(std::move(executable))
    , workspace_(workspace) {}

ToolOutput LibreOfficeExporter::export_document(
    const Bytes& document,
    std::string_view original_name,
    const ExportOptions& options)
{
    const std::string format = format_token(options.format, "format", "pdf");
    if (options.filter && !is_filter_name(*options.filter)) {
        throw PipelineError(ErrorKind::Validation,
                            "Field \"filter\" has an unsupported value", *options.filter);
    }

    const ScopedTempDir work = workspace_.acquire_dir();
    const fs::path input = work.path() / ("document" + input_extension(original_name));
    const fs::path out_dir = work.path() / "out";
    const fs::path profile = work.path() / "profile";
    fs::create_directories(out_dir);
    write_file(input, document);

    const std::string target = options.filter ? format + ":" + *options.filter : format;

    // A private user profile lets concurrent exports run side by side
    const std::vector<std::string> argv = {
        executable_,
        "-env:UserInstallation=file://" + profile.string(),
        "--headless", "--norestore", "--nolockcheck",
        "--convert-to", target,
        "--outdir", out_dir.string(),
        input.string()
    };

    spdlog::info("soffice: converting {} ({} bytes) to {}",
                 original_name, document.size(), target);
    const auto start_time = std::chrono::steady_clock::now();

    const CommandResult run = run_command(argv);
    if (run.exit_code == kCommandNotFound) {
        throw PipelineError(ErrorKind::ExternalTool, "Document converter is not available",
                            executable_ + " not found");
    }

    const fs::path output = out_dir / (input.stem().string() + "." + format);
    if (!run.ok() || !fs::exists(output)) {
        spdlog::error("soffice: error (exit {}): {}", run.exit_code, run.output);
        throw PipelineError(ErrorKind::ExternalTool, "Failed to convert the document",
                            run.output.empty() ? "no output produced" : run.output);
    }

    ToolOutput result;
    result.data = read_file(output);
    result.content_type = document_content_type(format);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("soffice: document converted to {} ({} bytes in {} ms)",
                 format, result.data.size(), elapsed);
    return result;
}

}  // namespace nxc::external
