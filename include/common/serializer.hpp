#ifndef CHUNKER_SERIALIZER_HPP
#define CHUNKER_SERIALIZER_HPP

#include "config.hpp"
#include "../files/header.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace Serializer {

/**
 * @brief Serializes a Header into its JSON text form.
 *
 * Output is deterministic: object keys are sorted and entries keep their order.
 *
 * @param h The header to encode.
 * @param target Path reported in error messages.
 * @return The serialized header.
 * @throws FormatError if the chunk size is zero or a name cannot be encoded
 *         (empty, embedded NUL, invalid UTF-8).
 */
std::string serialize_header(const Header& h, const fs::path& target = HEADER_FILE_NAME);

/**
 * @brief Parses a serialized header and validates it against the schema.
 *
 * @param text The serialized header.
 * @param source Path reported in error messages.
 * @throws MalformedHeaderError on syntax errors, missing or mistyped fields,
 *         duplicate names, or offsets/totals that disagree with the entries.
 */
Header deserialize_header(const std::string& text, const fs::path& source = HEADER_FILE_NAME);

/**
 * @brief Writes the serialized header to `path`.
 * @throws FormatError, WriteError
 */
void write_header_file(const Header& h, const fs::path& path);

/**
 * @brief Reads and parses the header stored at `path`.
 * @throws MissingHeaderError if the file does not exist, ReadError if it
 *         cannot be read, MalformedHeaderError on invalid content.
 */
Header read_header_file(const fs::path& path);

} // namespace Serializer

#endif //CHUNKER_SERIALIZER_HPP
