/**
 * @file ZeroWidthScanner.hpp
 * @brief Detection and decoding of zero-width steganographic payloads.
 */

#pragma once
#include <string>
#include <vector>

namespace polyglot::domain::markdown {

/**
 * @struct ZeroWidthRun
 * @brief Consecutive invisible characters found in the text.
 */
struct ZeroWidthRun {
    std::vector<char32_t> chars;
    int line = 0;
};

/**
 * @struct HiddenPayload
 * @brief Decoded run. encoding is "hidden_data" (valid UTF-8) or "hidden_binary" (hex content).
 */
struct HiddenPayload {
    std::string encoding;
    std::string content;
};

/**
 * @brief Scans raw bytes for U+200B, U+200C, U+200D, U+2060 and U+FEFF.
 *
 * Bit mapping used by the encoder: 200B = "0", 200C = "1", 200D = "01",
 * 2060 = "10", FEFF = "11". The concatenated bit string is read as a
 * big-endian unsigned integer.
 */
class ZeroWidthScanner {
public:
    static std::vector<ZeroWidthRun> Scan(const std::string& text);

    /** @brief Cheap presence check used by the polyglot pre-check. */
    static bool Contains(const std::string& text);

    /** @brief Removes every zero-width character. */
    static std::string Strip(const std::string& text);

    static HiddenPayload Decode(const ZeroWidthRun& run);

    /** @brief Decodes all runs; the result is hidden_binary if any run is. */
    static HiddenPayload DecodeAll(const std::vector<ZeroWidthRun>& runs);
};

} // namespace polyglot::domain::markdown
