/**
 * @file    external_tools.hpp
 * @brief   Opaque external converters (video, documents, remote media)
 * @license MIT
 *
 * @details
 * The gateway only depends on these interfaces. Concrete adapters shell
 * out to ffmpeg, LibreOffice and yt-dlp with scoped temporary files;
 * tests substitute in-memory fakes.
 *
 * All methods return the produced bytes or throw PipelineError
 * (Validation for bad parameters, ExternalTool for tool failures).
 */

#pragma once

#include "core/types.hpp"
#include "external/temp_workspace.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace nxc::external {

/**
 * Bytes produced by a tool plus their MIME type
 */
struct ToolOutput {
    Bytes data;
    std::string content_type;
};

/**
 * Validate a container/format token used in file names and tool arguments
 *
 * @param value     Raw value (nullopt or empty -> fallback)
 * @param field     Field name for the error message
 * @param fallback  Default token
 * @return          Lowercased token matching [a-z0-9]{1,10}
 * @throws PipelineError(Validation) on any other value
 */
[[nodiscard]] std::string format_token(
    std::optional<std::string_view> value,
    std::string_view field,
    std::string_view fallback
);

// True for a lowercase token matching [a-z0-9]{1,10}
[[nodiscard]] bool is_format_token(std::string_view token) noexcept;

// MIME type for a document export format ("pdf" -> "application/pdf")
[[nodiscard]] std::string document_content_type(std::string_view format);

// =============================================================================
// Transcoder
// =============================================================================

struct TranscodeOptions {
    std::string container{"mp4"};
    std::optional<std::string> video_bitrate;   // e.g. "2500k"
    std::optional<std::string> audio_bitrate;   // e.g. "128k"
};

class ITranscoder {
public:
    virtual ~ITranscoder() = default;

    [[nodiscard]] virtual ToolOutput transcode(const Bytes& media,
                                               const TranscodeOptions& options) = 0;
};

// =============================================================================
// Document exporter
// =============================================================================

struct ExportOptions {
    std::string format{"pdf"};
    std::optional<std::string> filter;          // e.g. "writer_pdf_Export"
};

class IDocumentExporter {
public:
    virtual ~IDocumentExporter() = default;

    /**
     * @param document       Uploaded document bytes
     * @param original_name  Uploaded file name (its extension selects the import filter)
     */
    [[nodiscard]] virtual ToolOutput export_document(const Bytes& document,
                                                     std::string_view original_name,
                                                     const ExportOptions& options) = 0;
};

// =============================================================================
// Remote media fetcher
// =============================================================================

class IMediaFetcher {
public:
    virtual ~IMediaFetcher() = default;

    // Only http(s) URLs are accepted
    [[nodiscard]] virtual ToolOutput fetch(std::string_view url, std::string_view container) = 0;
};

// =============================================================================
// Tool-backed implementations
// =============================================================================

class FfmpegTranscoder : public ITranscoder {
public:
    FfmpegTranscoder(std::string executable, const TempWorkspace& workspace);

    [[nodiscard]] ToolOutput transcode(const Bytes& media,
                                       const TranscodeOptions& options) override;

private:
    std::string executable_;
    const TempWorkspace& workspace_;
};

class LibreOfficeExporter : public IDocumentExporter {
public:
    LibreOfficeExporter(std::string executable, const TempWorkspace& workspace);

    [[nodiscard]] ToolOutput export_document(const Bytes& document,
                                             std::string_view original_name,
                                             const ExportOptions& options) override;

private:
    std::string executable_;
    const TempWorkspace& workspace_;
};

class YtDlpFetcher : public IMediaFetcher {
public:
    YtDlpFetcher(std::string executable, const TempWorkspace& workspace);

    [[nodiscard]] ToolOutput fetch(std::string_view url, std::string_view container) override;

private:
    std::string executable_;
    const TempWorkspace& workspace_;
};

// True for absolute http:// or https:// URLs without whitespace or control characters
[[nodiscard]] bool is_fetchable_url(std::string_view url) noexcept;

}  // namespace nxc::external
