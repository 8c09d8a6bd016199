// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#ifndef DISCOFILL_VERSION_HPP
#define DISCOFILL_VERSION_HPP

#include <string>

namespace discofill {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 1;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The Discofill developers";

// Sent to the catalog service, which asks clients to identify themselves
inline std::string GetUserAgent() {
  return "discofill/" + GetVersionString() +
         " ( https://github.com/discofill/discofill )";
}

inline std::string GetFullVersionString() {
  return "discofill version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace discofill

#endif // DISCOFILL_VERSION_HPP
