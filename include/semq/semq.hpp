#ifndef SEMQ_HPP
#define SEMQ_HPP

// Main header that includes everything

#include <semq/errors.hpp>
#include <semq/event_stream.hpp>
#include <semq/extract.hpp>
#include <semq/logging.hpp>
#include <semq/response.hpp>
#include <semq/scanner.hpp>
#include <semq/source.hpp>
#include <semq/stream.hpp>
#include <semq/text_decoder.hpp>
#include <semq/types.hpp>
#include <semq/version.hpp>

// Optional: heuristics for responses carrying a single JSON document
// (markdown fences, first valid object). Not needed for item streams.
#include <semq/json_utils.hpp>

#endif // SEMQ_HPP
