#include <cstddef>
#include <string>

#ifndef UTIL_HPP
#define UTIL_HPP

// Room ids handed out by the client when the user does not pick one.
// I, O, 0 and 1 are left out.
const char* const kRoomIdAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
const size_t kRoomIdLength = 6;

std::string generateRoomId();

// Percent-decoding of one URL path segment. '+' is left alone since it
// only means space in query strings. Throws std::invalid_argument on a
// truncated or non-hex escape.
std::string urlDecode(const std::string& segment);
std::string urlEncode(const std::string& segment);

std::string guessMimeType(const std::string& fileName);

// Strips directories and anything else that would let a remote name escape
// the download directory. Never returns an empty string.
std::string sanitizeFileName(const std::string& name);

#endif // UTIL_HPP
