#include "ridesafe/notifier.h"

#include "ridesafe/log.h"

namespace ridesafe {

std::string urlEncode(const std::string& text) {
  static const char HEX_DIGITS[] = "0123456789ABCDEF";

  std::string encoded;
  encoded.reserve(text.size() * 3);
  for (size_t i = 0; i < text.size(); i++) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') ||
                      c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved) {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += HEX_DIGITS[c >> 4];
      encoded += HEX_DIGITS[c & 0x0F];
    }
  }
  return encoded;
}

TelegramNotifier::TelegramNotifier(HttpClient& http, const char* botToken, const char* chatId)
    : http(http), botToken(botToken), chatId(chatId) {}

std::string TelegramNotifier::endpoint() const {
  return "https://api.telegram.org/bot" + botToken + "/sendMessage";
}

Fault TelegramNotifier::send(const std::string& message) {
  std::string body = "chat_id=" + urlEncode(chatId) + "&text=" + urlEncode(message);

  logLine("📡 Sending Telegram alert...");
  HttpResponse response = http.postForm(endpoint(), body);

  if (response.statusCode <= 0) {
    logPrintf("❌ Error sending message, code: %d\n", response.statusCode);
    return Fault::NOTIFY_FAILURE;
  }

  logPrintf("Telegram response (%d): %s\n", response.statusCode, response.body.c_str());
  return Fault::NONE;
}

}  // namespace ridesafe
