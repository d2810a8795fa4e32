#pragma once

#include <control_channel.hpp>
#include <demo_sequence.hpp>
#include <log.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <cstdint>
#include <utility>

namespace esp32 {

/**
 * @brief FreeRTOS task that plays the scripted demo through the control channel
 *
 * Stands in for the touch inputs on a bare board: it owns the producer end of
 * the channel and pushes one DemoSequence step at a time, sleeping for the
 * step's delay in between. A full channel drops the message; the next sweep
 * step supersedes it anyway.
 */
class DemoTask {
public:
    /**
     * @param producer Producer end of the control channel (taken over)
     * @param priority FreeRTOS priority, below the audio task
     * @param core Core to pin to (the render loop owns core 1)
     */
    explicit DemoTask(control::ControlProducer producer,
                      UBaseType_t priority = 1,
                      BaseType_t core = 0)
        : producer_(std::move(producer)) {

        BaseType_t created = xTaskCreatePinnedToCore(
            taskFunction,
            "demo",
            4096,
            this,
            priority,
            &taskHandle_,
            core
        );

        if (created != pdPASS) {
            logError("Failed to create demo task");
            taskHandle_ = nullptr;
            return;
        }

        logInfo("Demo task started on core %d", static_cast<int>(core));
    }

    ~DemoTask() {
        if (taskHandle_ != nullptr) {
            vTaskDelete(taskHandle_);
            taskHandle_ = nullptr;
        }
    }

    DemoTask(const DemoTask&) = delete;
    DemoTask& operator=(const DemoTask&) = delete;

    bool isRunning() const { return taskHandle_ != nullptr; }

private:
    static void taskFunction(void* parameter) {
        static_cast<DemoTask*>(parameter)->run();
    }

    void run() {
        while (true) {
            control::DemoSequence::Step step = sequence_.next();
            if (!producer_.push(step.message) && producer_.droppedCount() % 100 == 1) {
                logWarn("Control channel full, dropped %lu demo messages",
                        static_cast<unsigned long>(producer_.droppedCount()));
            }
            // Yield at least one tick so the lower-priority idle task can run
            vTaskDelay(step.delayMs > 0 ? pdMS_TO_TICKS(step.delayMs) : 1);
        }
    }

    control::ControlProducer producer_;
    control::DemoSequence sequence_;
    TaskHandle_t taskHandle_ = nullptr;
};

} // namespace esp32
