#ifndef SEMQ_JSON_UTILS_HPP
#define SEMQ_JSON_UTILS_HPP

#include <optional>
#include <semq/logging.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace semq
{

// ============================================================================
// Single-document JSON extraction
//
// Heuristics for responses expected to carry one JSON document, possibly
// wrapped in markdown or surrounded by prose. For mixed text/data streams use
// build_parsed_stream() or extract_all() instead.
// ============================================================================

/// Outcome of process_response()
struct ExtractionResult
{
    std::string raw;                        // Response as received
    std::vector<std::string> segmented;     // Trimmed non-JSON text around the document
    std::optional<std::string> json_response;
    bool json_extraction_successful = false;
    std::string extraction_method = "none"; // "markdown", "advanced" or "raw"
};

/// Contents of the first fenced code block, trimmed.
/// "```json" fences are preferred over bare "```" fences.
std::optional<std::string> extract_json_from_markdown(std::string_view response);

/// Balanced object at the very start of `text` (which must begin with '{').
/// Braces inside string literals are ignored. The result is not validated.
std::optional<std::string> find_matching_json_object(std::string_view text);

/// First line starting with '{' that parses as JSON on its own or joined with
/// up to 50 following lines
std::optional<std::string> try_line_by_line_json(std::string_view response);

/// First balanced object that is valid JSON, falling back to try_line_by_line_json()
std::optional<std::string> extract_json_advanced(std::string_view response);

/// Trimmed text before and after the first occurrence of `json_content`
std::vector<std::string> segment_non_json_content(std::string_view raw_response,
                                                  std::string_view json_content);

/**
 * Extract a JSON document from a response.
 *
 * Tries markdown code fences first, then extract_json_advanced(). When neither
 * finds anything the whole response is returned as json_response with method
 * "raw" and json_extraction_successful left false.
 */
ExtractionResult process_response(std::string raw_response, const Logger& logger = Logger());

/// The JSON part of a response, or the response itself when there is none
std::string find_json(std::string_view response);

} // namespace semq

#endif // SEMQ_JSON_UTILS_HPP
