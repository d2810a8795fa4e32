#pragma once

#include <telemetry_sink.hpp>
#include <log.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <string>

namespace esp32 {

/**
 * @brief Telemetry sink that keeps JSON formatting off the audio core
 *
 * sendTelemetry() only copies the snapshot into a single-slot overwrite
 * queue, so it is safe to call from the render task. A background task pinned
 * to another core serializes snapshots with to_json() and prints them as JSON
 * Lines. A snapshot not picked up before the next one arrives is replaced.
 *
 * @tparam TelemetryDataT Trivially copyable snapshot type with a to_json function
 */
template<typename TelemetryDataT>
class Esp32TelemetrySink : public features::TelemetrySink<TelemetryDataT> {
public:
    /**
     * @param taskName Name of the output task
     * @param priority FreeRTOS priority of the output task
     * @param core Core the output task is pinned to (keep it off the audio core)
     */
    explicit Esp32TelemetrySink(const std::string& taskName = "telemetry",
                                UBaseType_t priority = 0,
                                BaseType_t core = 0)
        : queue_(nullptr)
        , taskHandle_(nullptr)
        , shouldStop_(false)
        , stopped_(false)
    {
        queue_ = xQueueCreate(1, sizeof(TelemetryDataT));
        if (queue_ == nullptr) {
            logError("Failed to create telemetry queue");
            return;
        }

        BaseType_t taskCreated = xTaskCreatePinnedToCore(
            outputTaskEntry,
            taskName.c_str(),
            4096,  // JSON serialization needs a roomy stack
            this,
            priority,
            &taskHandle_,
            core
        );

        if (taskCreated != pdPASS) {
            logError("Failed to create telemetry task: %s", taskName.c_str());
            vQueueDelete(queue_);
            queue_ = nullptr;
            taskHandle_ = nullptr;
        } else {
            logInfo("Telemetry task started: %s on core %d", taskName.c_str(), static_cast<int>(core));
        }
    }

    ~Esp32TelemetrySink() {
        if (taskHandle_ != nullptr) {
            shouldStop_ = true;

            // Wake the task if it is blocked on an empty queue
            TelemetryDataT wake{};
            xQueueOverwrite(queue_, &wake);

            // The task deletes itself; wait until it is past its last queue access
            for (int i = 0; i < 20 && !stopped_; ++i) {
                vTaskDelay(pdMS_TO_TICKS(10));
            }
            if (!stopped_) {
                vTaskDelete(taskHandle_);
            }
            taskHandle_ = nullptr;
            logInfo("Telemetry task stopped");
        }

        if (queue_ != nullptr) {
            vQueueDelete(queue_);
            queue_ = nullptr;
        }
    }

    Esp32TelemetrySink(const Esp32TelemetrySink&) = delete;
    Esp32TelemetrySink& operator=(const Esp32TelemetrySink&) = delete;

    void sendTelemetry(const TelemetryDataT& data) override {
        if (queue_ != nullptr && !shouldStop_) {
            xQueueOverwrite(queue_, &data);
        }
    }

private:
    static void outputTaskEntry(void* parameter) {
        static_cast<Esp32TelemetrySink<TelemetryDataT>*>(parameter)->outputTask();
        // FreeRTOS tasks must never return
        vTaskDelete(nullptr);
    }

    void outputTask() {
        TelemetryDataT snapshot;

        while (!shouldStop_) {
            if (xQueueReceive(queue_, &snapshot, pdMS_TO_TICKS(100)) != pdTRUE || shouldStop_) {
                continue;
            }
            nlohmann::json j = snapshot;
            printf("%s\n", j.dump().c_str());
        }
        stopped_ = true;
    }

    QueueHandle_t queue_;
    TaskHandle_t taskHandle_;
    volatile bool shouldStop_;
    volatile bool stopped_;
};

} // namespace esp32
