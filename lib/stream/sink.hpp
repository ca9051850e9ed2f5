// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <functional>
#include <utility>

#include "lib/stream/error.hpp"
#include "src/value.hpp"

namespace hcat_pipe {

/// Concept for the minimal sink lifecycle: error, completion, and invalidation.
///
/// Every sink must support OnError, OnComplete, and Invalidate.
template<typename S>
concept BasicSink = requires(S& s, const Error& e) {
    { s.OnError(e) } -> std::same_as<void>;
    { s.OnComplete() } -> std::same_as<void>;
    { s.Invalidate() } -> std::same_as<void>;
};

/// Concept for a sink that receives converted records with their keys.
///
/// Refines BasicSink by adding an OnRecord callback.
template<typename S>
concept RecordSink = BasicSink<S> && requires(S& s, RecordKey&& key, ConvertedRecord&& rec) {
    { s.OnRecord(std::move(key), std::move(rec)) } -> std::same_as<void>;
};

/// Concrete record sink that dispatches through user-provided callbacks.
///
/// All callbacks are guarded by an atomic validity flag: once Invalidate()
/// is called, subsequent OnRecord / OnError / OnComplete calls are silently
/// dropped, so a torn-down consumer is never called back.
class StreamRecordSink {
public:
    /// Construct with callbacks for record, error, and completion events.
    /// @param on_record    Invoked for each converted record.
    /// @param on_error     Invoked when a record fails.
    /// @param on_complete  Invoked when the mapper is cleaned up.
    StreamRecordSink(
        std::function<void(RecordKey&&, ConvertedRecord&&)> on_record,
        std::function<void(const Error&)> on_error,
        std::function<void()> on_complete
    ) : on_record_(std::move(on_record)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)) {}

    /// Deliver a converted record downstream.
    void OnRecord(RecordKey&& key, ConvertedRecord&& record) {
        if (valid_.load(std::memory_order_acquire)) on_record_(std::move(key), std::move(record));
    }

    /// Report an error to the downstream consumer.
    void OnError(const Error& e) {
        if (valid_.load(std::memory_order_acquire)) on_error_(e);
    }

    /// Signal that no further records follow.
    void OnComplete() {
        if (valid_.load(std::memory_order_acquire)) on_complete_();
    }

    /// Atomically disable all future callback dispatches.
    void Invalidate() { valid_.store(false, std::memory_order_release); }

private:
    std::function<void(RecordKey&&, ConvertedRecord&&)> on_record_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    std::atomic<bool> valid_{true};
};

static_assert(RecordSink<StreamRecordSink>, "StreamRecordSink must satisfy RecordSink");

}  // namespace hcat_pipe
