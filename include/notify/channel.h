#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace notify {

// Снимок события: путь к файлу (может быть пустым, если запись не удалась)
// и закодированный JPEG. Каналы только читают его.
struct Snapshot {
    std::string path;
    std::vector<unsigned char> jpeg;

    bool has_image() const { return !jpeg.empty(); }
    std::string filename() const;   // basename(path) или "snapshot.jpg"
};

enum class DeliveryStatus {
    Delivered,
    Failed,
    Skipped     // канал выключен (нет URL/токена), это не ошибка
};

struct ChannelOutcome {
    DeliveryStatus status = DeliveryStatus::Skipped;
    std::string reason;

    static ChannelOutcome delivered() { return {DeliveryStatus::Delivered, {}}; }
    static ChannelOutcome skipped(std::string why) { return {DeliveryStatus::Skipped, std::move(why)}; }
    static ChannelOutcome failed(std::string why) { return {DeliveryStatus::Failed, std::move(why)}; }
};

struct ChannelReport {
    std::string channel;
    std::uint64_t event_id = 0;
    ChannelOutcome outcome;
};

const char* to_string(DeliveryStatus s);

// Канал доставки уведомления. send() не бросает: любая проблема
// превращается в ChannelOutcome::failed и никак не влияет на другие каналы.
class Channel {
public:
    virtual ~Channel() = default;

    virtual const std::string& name() const = 0;
    virtual bool enabled() const = 0;

    // snapshot == nullptr или без картинки -> текстовое сообщение.
    virtual ChannelOutcome send(const std::string& message, const Snapshot* snapshot) = 0;

    // Прервать выполняющийся send() (если канал это умеет).
    virtual void cancel() {}
};

} // namespace notify
