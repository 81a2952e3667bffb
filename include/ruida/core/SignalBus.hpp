#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ruida::core {

/**
 * @brief Publish/subscribe channel keyed by string topics.
 *
 * Payloads travel as `std::any`; subscribers `std::any_cast` to the type the
 * topic documents. Handlers run on the publishing thread, outside the lock.
 */
class SignalBus {
public:
    using Handler = std::function<void(const std::any&)>;
    using Token = std::size_t;

    Token subscribe(const std::string& topic, Handler handler);
    void unsubscribe(Token token);

    void publish(const std::string& topic, const std::any& payload = {});

    std::size_t subscriberCount(const std::string& topic) const;

private:
    struct Entry {
        Token token;
        Handler handler;
    };

    mutable std::mutex mutex;
    std::map<std::string, std::vector<Entry>> topics;
    Token nextToken = 1;
};

// Topics published by this library.
namespace topics {
inline const std::string SessionEvents = "session/events";          // std::string
inline const std::string Position = "driver;position";              // PositionChange
inline const std::string Status = "driver;status";                  // std::string
inline const std::string CardId = "driver;card_id";                 // std::uint64_t
inline const std::string BedSize = "driver;bed_size";               // std::pair<double,double> (mm)
inline const std::string PlotCommitted = "emulator;plot";           // PlotCut
inline const std::string EmulatorError = "emulator;error";          // protocol::DecodeError
} // namespace topics

} // namespace ruida::core
