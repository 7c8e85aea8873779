#pragma once

#include "core/SPSCQueue.h"
#include "core/Logger.h"

#include <cstdint>

namespace redub {

/// Control thread -> audio thread.
struct Command {
    enum class Type {
        swapProgram,
        transportPlay,
        transportPause,
        transportStop,
        transportSeek,
        startVoice,
        stopVoice,
        stopAllVoices,
        setCaptureSink
    };

    Type type;

    void* ptr = nullptr;
    int64_t int64Value = 0;
    int intValue = 0;
};

/// Audio thread -> control thread.
struct EngineEvent {
    enum class Type { voiceEnded, transportEnded };

    Type type = Type::voiceEnded;
    int voiceId = -1;
    int64_t clockSamples = 0;   // engine clock at the end of the block that raised it
};

/// Heap object handed back by the audio thread for deletion on the control thread.
struct GarbageItem {
    void* ptr = nullptr;
    void (*deleter)(void*) = nullptr;

    void destroy()
    {
        if (ptr && deleter)
            deleter(ptr);
        ptr = nullptr;
    }

    template<typename T>
    static GarbageItem wrap(T* p)
    {
        return {p, [](void* raw) { delete static_cast<T*>(raw); }};
    }
};

inline const char* commandTypeName(Command::Type type)
{
    switch (type) {
        case Command::Type::swapProgram:    return "swapProgram";
        case Command::Type::transportPlay:  return "transportPlay";
        case Command::Type::transportPause: return "transportPause";
        case Command::Type::transportStop:  return "transportStop";
        case Command::Type::transportSeek:  return "transportSeek";
        case Command::Type::startVoice:     return "startVoice";
        case Command::Type::stopVoice:      return "stopVoice";
        case Command::Type::stopAllVoices:  return "stopAllVoices";
        case Command::Type::setCaptureSink: return "setCaptureSink";
    }
    return "unknown";
}

class CommandQueue {
public:
    CommandQueue() = default;
    ~CommandQueue() = default;

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // --- Control thread ---
    bool sendCommand(const Command& cmd)
    {
        if (!commands_.tryPush(cmd)) {
            RD_WARN("CommandQueue: command queue full, dropping %s", commandTypeName(cmd.type));
            return false;
        }
        RD_TRACE("CommandQueue: sent %s", commandTypeName(cmd.type));
        return true;
    }

    int collectGarbage()
    {
        return garbage_.drain([](GarbageItem& item) { item.destroy(); });
    }

    template<typename Handler>
    int drainEvents(Handler&& handler)
    {
        return events_.drain(handler);
    }

    // --- Audio thread ---
    template<typename Handler>
    int processPending(Handler&& handler)
    {
        return commands_.drain(handler);
    }

    bool sendGarbage(const GarbageItem& item)
    {
        if (!garbage_.tryPush(item)) {
            RD_WARN_RT("CommandQueue: garbage queue full, item leaked");
            return false;
        }
        return true;
    }

    bool postEvent(const EngineEvent& event)
    {
        if (!events_.tryPush(event)) {
            RD_WARN_RT("CommandQueue: event queue full, dropping event type=%d voice=%d",
                       static_cast<int>(event.type), event.voiceId);
            return false;
        }
        return true;
    }

private:
    static constexpr int kCommandCapacity = 512;
    static constexpr int kGarbageCapacity = 512;
    static constexpr int kEventCapacity   = 512;

    SPSCQueue<Command, kCommandCapacity> commands_;
    SPSCQueue<GarbageItem, kGarbageCapacity> garbage_;
    SPSCQueue<EngineEvent, kEventCapacity> events_;
};

} // namespace redub
