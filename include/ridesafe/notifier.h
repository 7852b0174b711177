#ifndef __RIDESAFE_NOTIFIER_H__
#define __RIDESAFE_NOTIFIER_H__

#include <string>

#include "ridesafe/faults.h"
#include "ridesafe/hal.h"

namespace ridesafe {

/**
 * Remote notification sink
 */
class Notifier {
public:
  virtual ~Notifier() {}

  /**
   * Deliver a message, fire-and-forget
   * @return Fault::NONE, or Fault::NOTIFY_FAILURE if it could not be sent
   */
  virtual Fault send(const std::string& message) = 0;
};

/**
 * Telegram bot notifier
 *
 * POST https://api.telegram.org/bot<token>/sendMessage
 * body: chat_id=<id>&text=<url-encoded message>
 *
 * Any HTTP response counts as delivered; only transport errors fail.
 */
class TelegramNotifier : public Notifier {
private:
  HttpClient& http;
  std::string botToken;
  std::string chatId;

public:
  TelegramNotifier(HttpClient& http, const char* botToken, const char* chatId);

  Fault send(const std::string& message) override;

  std::string endpoint() const;
};

/**
 * Percent-encode everything except unreserved characters (A-Z a-z 0-9 - _ . ~)
 */
std::string urlEncode(const std::string& text);

}  // namespace ridesafe

#endif  // __RIDESAFE_NOTIFIER_H__
