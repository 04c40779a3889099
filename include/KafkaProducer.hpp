/**
 * @file    KafkaProducer.hpp
 * @brief   Singleton wrapper for producing messages to Kafka using librdkafka.
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Provides configuration loading from YAML, a cached topic handle per topic
 *   name, delivery-report logging, and clean flush-and-close shutdown.
 */

#pragma once

#ifndef KAFKA_PRODUCER_HPP_
#define KAFKA_PRODUCER_HPP_

#include <librdkafka/rdkafka.h>
#include <string>
#include <unordered_map>
#include <mutex>
#include <shared_mutex>

namespace book_watch {

/**
 * @class KafkaProducer
 * @brief Singleton for producing to Kafka, managing configuration and topic handles.
 */
class KafkaProducer {
public:
    /**
     * @brief Returns the singleton instance of KafkaProducer.
     */
    static KafkaProducer& instance();

    /**
     * @brief Initializes producer and loads configuration from YAML.
     * @param config_path Path to the YAML config file.
     * @throws std::runtime_error on error (bad YAML, librdkafka failure, etc.)
     */
    void initialize(const std::string& config_path);

    /**
     * @brief Returns the producer handle (nullptr before initialize()).
     */
    rd_kafka_t* get_producer();

    /**
     * @brief Returns a cached topic handle, creating it on first use.
     */
    rd_kafka_topic_t* get_or_create_topic(const std::string& topic);

    /**
     * @brief Serve delivery reports.
     */
    void poll(int timeout_ms = 0);

    /**
     * @brief Flush outstanding messages, release topics and the producer.
     */
    void shutdown();

    /* Prevent copy/move */
    KafkaProducer(const KafkaProducer&) = delete;
    KafkaProducer& operator=(const KafkaProducer&) = delete;

private:
    KafkaProducer();
    ~KafkaProducer();

    void parse_config(const std::string& config_path);

    static void delivery_report(rd_kafka_t* rk, const rd_kafka_message_t* msg, void* opaque);

    /* YAML-derived config */
    std::string bootstrap_servers_;
    std::string linger_ms_;
    std::string acks_;

    rd_kafka_t* producer_;
    std::unordered_map<std::string, rd_kafka_topic_t*> topics_;
    mutable std::shared_mutex producer_mutex_;
    bool initialized_;
};

} // namespace book_watch

#endif /* KAFKA_PRODUCER_HPP_ */
