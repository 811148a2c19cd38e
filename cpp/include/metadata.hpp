#pragma once

#include "execution_result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace agentshell {
namespace core {
namespace metadata {

// Sentinels delimiting the completion record in shell output.
inline constexpr std::string_view kBeginMarker = "###AGENTSHELL_CMD_BEGIN###";
inline constexpr std::string_view kEndMarker   = "###AGENTSHELL_CMD_END###";

/**
 * @brief A decoded completion record and where it sits in the scanned text.
 */
struct RecordMatch {
    CompletionRecord record{};
    size_t           begin{};  ///< Offset of the BEGIN marker
    size_t           end{};    ///< Offset one past the END marker
};

/**
 * @brief Locate and decode the first BEGIN...END span in @p text.
 *
 * Spans whose payload does not decode are skipped. Returns nullopt when no
 * decodable span exists yet (the record may still be arriving); that is not
 * an error.
 */
std::optional<RecordMatch> find_record(std::string_view text);

/**
 * @brief Decode the single-line JSON payload found between the markers.
 *
 * Numeric fields are accepted as JSON numbers or numeric strings (prompt
 * expansion produces strings). exit_code is mandatory.
 */
std::optional<CompletionRecord> parse_record(std::string_view payload);

// Definition of the bash function the record statement uses to JSON-escape
// string fields. Must run in the shell before any record is printed.
std::string posix_json_escaper();

// printf statement printing BEGIN, the JSON record and END; the exit code is
// read from the shell variable named @p exit_var.
std::string posix_record_statement(std::string_view exit_var);

// <command> read from a here-document and eval'ed, then a record of its exit status.
std::string posix_wrap_command(std::string_view command);

// Escaper, shell function and PROMPT_COMMAND printing a record after every command.
std::string posix_prompt_hook();

// <command>, then on the next line the interpreter-native record expression.
std::string powershell_wrap_command(std::string_view command);

} // namespace metadata
} // namespace core
} // namespace agentshell
