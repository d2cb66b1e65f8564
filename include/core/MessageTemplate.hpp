#pragma once

#include <chrono>
#include <map>
#include <string>

namespace mirror::core {

/// Tokens recognized in commit-message templates.
enum class MessageToken { Timestamp, Hash };

/// Substitutes the closed token set (${timestamp}, ${hash}) into a template.
/// Any other ${...} sequence is left verbatim.
/// Class abbreviation: mt
class MessageTemplate {
 public:
  explicit MessageTemplate(std::string sTemplate);

  std::string render(const std::map<MessageToken, std::string>& mValues) const;

  const std::string& text() const { return _sTemplate; }

  /// "${timestamp}" for Timestamp, "${hash}" for Hash.
  static const char* placeholder(MessageToken token);

  /// Local time as "YYYY-MM-DD HH:MM:SS".
  static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

 private:
  std::string _sTemplate;
};

}  // namespace mirror::core
