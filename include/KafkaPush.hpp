/**
 * @file    KafkaPush.hpp
 * @brief   Inline function for pushing messages to a Kafka topic (thread-safe).
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Provides an inline helper function for any worker thread to publish
 *   (typically JSON) messages into a given Kafka topic and partition,
 *   using the KafkaProducer singleton backend.
 */
#pragma once

#ifndef KAFKA_PUSH_HPP_
#define KAFKA_PUSH_HPP_

#include "KafkaProducer.hpp"
#include <string>
#include <cstddef>
#include <cstdint>
#include "spdlog/spdlog.h"

namespace book_watch {

/**
 * @brief   Publishes a message to a Kafka topic and partition (thread-safe).
 *
 *          Uses the KafkaProducer singleton instance. If the producer or topic handle
 *          is unavailable, logs an error. Errors during publishing (asynchronous) are logged.
 *
 * @param   topic_name  The Kafka topic name.
 * @param   partition   The Kafka partition to publish to (RD_KAFKA_PARTITION_UA for auto).
 * @param   key         Message key used for partitioning.
 * @param   data        Pointer to message payload (typically JSON).
 * @param   len         Size in bytes of the payload.
 * @return  true if the message was queued.
 */
inline bool KafkaPush(const std::string& topic_name, int32_t partition, const std::string& key,
                      const void* data, size_t len) {
    KafkaProducer& kp = KafkaProducer::instance();
    rd_kafka_t* producer = kp.get_producer();
    rd_kafka_topic_t* topic = kp.get_or_create_topic(topic_name);

    if (!producer || !topic) {
        SPDLOG_ERROR("Error: Producer or topic ({}) not available!  producer=0x{:X}, topic=0x{:X}",
             topic_name, (uintptr_t)producer, (uintptr_t)topic);
        return false;
    }

    int ret = rd_kafka_produce(
        topic,
        partition,
        RD_KAFKA_MSG_F_COPY,
        const_cast<void*>(data), len,
        key.data(), key.size(),
        nullptr);
    if (ret == -1) {
        rd_kafka_resp_err_t err = rd_kafka_last_error();
        SPDLOG_WARN("Push failed for topic {} partition {}: {}", topic_name, partition, rd_kafka_err2str(err));
        return false;
    }
    // else: success (asynchronous), delivery report logs failures
    return true;
}

} // namespace book_watch

#endif
