#include "core/MessageTemplate.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace mirror::core {

MessageTemplate::MessageTemplate(std::string sTemplate) : _sTemplate(std::move(sTemplate)) {}

const char* MessageTemplate::placeholder(MessageToken token) {
  switch (token) {
    case MessageToken::Timestamp:
      return "${timestamp}";
    case MessageToken::Hash:
      return "${hash}";
  }
  return "";
}

std::string MessageTemplate::render(const std::map<MessageToken, std::string>& mValues) const {
  std::string sOut = _sTemplate;
  for (const auto& [token, sValue] : mValues) {
    const std::string sPlaceholder = placeholder(token);
    std::size_t iPos = 0;
    while ((iPos = sOut.find(sPlaceholder, iPos)) != std::string::npos) {
      sOut.replace(iPos, sPlaceholder.size(), sValue);
      iPos += sValue.size();
    }
  }
  return sOut;
}

std::string MessageTemplate::formatTimestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tmLocal{};
  localtime_r(&tt, &tmLocal);
  std::ostringstream oss;
  oss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace mirror::core
