/**
 * @file    KafkaConsumer.cpp
 * @brief   Kafka consumer implementation using librdkafka.
 *
 * Description:
 *   Handles config loading from YAML, topic subscription, thread-safe
 *   polling, and clean shutdown of the consumer handle.
 */

#include "KafkaConsumer.hpp"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace book_watch {

KafkaConsumer::KafkaConsumer()
    : consumer_(nullptr), initialized_(false) {}

KafkaConsumer::~KafkaConsumer() {
    shutdown();
}

void KafkaConsumer::initialize(const std::string& config_path) {
    std::unique_lock lock(consumer_mutex_);
    if (initialized_) return; // Already initialized
    parse_config(config_path);

    char errstr[512];
    rd_kafka_conf_t* conf = rd_kafka_conf_new();

    // Required: bootstrap servers and group.id
    if (rd_kafka_conf_set(conf, "bootstrap.servers", bootstrap_servers_.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        rd_kafka_conf_destroy(conf);
        throw std::runtime_error("Failed to set bootstrap.servers: " + std::string(errstr));
    }
    if (rd_kafka_conf_set(conf, "group.id", group_id_.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        rd_kafka_conf_destroy(conf);
        throw std::runtime_error("Failed to set group.id: " + std::string(errstr));
    }

    const std::pair<const char*, const std::string*> optional_settings[] = {
        {"session.timeout.ms", &session_timeout_ms_},
        {"auto.offset.reset", &auto_offset_reset_},
        {"enable.auto.commit", &enable_auto_commit_},
    };
    for (const auto& [key, value] : optional_settings) {
        if (rd_kafka_conf_set(conf, key, value->c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
            SPDLOG_WARN("KafkaConsumer ignoring {}={}: {}", key, *value, errstr);
        }
    }

    // rd_kafka_new takes ownership of conf on success only
    consumer_ = rd_kafka_new(RD_KAFKA_CONSUMER, conf, errstr, sizeof(errstr));
    if (!consumer_) {
        rd_kafka_conf_destroy(conf);
        throw std::runtime_error("Failed to create Kafka consumer: " + std::string(errstr));
    }

    rd_kafka_poll_set_consumer(consumer_); // Required for consumer

    initialized_ = true;
    SPDLOG_INFO("KafkaConsumer initialized (bootstrap={}, group={})", bootstrap_servers_, group_id_);
}

void KafkaConsumer::parse_config(const std::string& config_path) {
    SPDLOG_INFO("KafkaConsumer loading config file: {}", config_path);
    YAML::Node config = YAML::LoadFile(config_path);

    auto kafka = config["kafka_consumer"];
    if (!kafka)
        throw std::runtime_error("KafkaConsumer config: missing 'kafka_consumer' node");

    bootstrap_servers_   = kafka["bootstrap_servers"] ? kafka["bootstrap_servers"].as<std::string>() : "localhost:9092";
    group_id_            = kafka["group_id"]          ? kafka["group_id"].as<std::string>()          : "book-watch";
    session_timeout_ms_  = kafka["session_timeout_ms"]? std::to_string(kafka["session_timeout_ms"].as<int>()) : "6000";
    auto_offset_reset_   = kafka["auto_offset_reset"] ? kafka["auto_offset_reset"].as<std::string>() : "earliest";
    enable_auto_commit_  = kafka["enable_auto_commit"]? kafka["enable_auto_commit"].as<bool>() ? "true" : "false" : "true";
}

void KafkaConsumer::subscribe(const std::vector<std::string>& topics) {
    std::unique_lock lock(consumer_mutex_);

    if (!consumer_)
        throw std::runtime_error("KafkaConsumer::subscribe: Consumer not initialized");

    rd_kafka_topic_partition_list_t* topic_list = rd_kafka_topic_partition_list_new(static_cast<int>(topics.size()));
    for (const auto& topic : topics) {
        rd_kafka_topic_partition_list_add(topic_list, topic.c_str(), RD_KAFKA_PARTITION_UA);
        subscribed_topics_.insert(topic);
    }
    rd_kafka_resp_err_t err = rd_kafka_subscribe(consumer_, topic_list);
    rd_kafka_topic_partition_list_destroy(topic_list);

    if (err)
        throw std::runtime_error("KafkaConsumer::subscribe: Failed to subscribe to topics: " + std::string(rd_kafka_err2str(err)));

    SPDLOG_INFO("KafkaConsumer subscribed to {} topics", topics.size());
}

rd_kafka_message_t* KafkaConsumer::consume(int timeout_ms) {
    std::shared_lock lock(consumer_mutex_);
    if (!consumer_)
        return nullptr;

    rd_kafka_message_t* msg = rd_kafka_consumer_poll(consumer_, timeout_ms);
    return msg; // msg is managed by caller (must call rd_kafka_message_destroy)
}

void KafkaConsumer::shutdown() {
    std::unique_lock lock(consumer_mutex_);
    if (consumer_) {
        SPDLOG_INFO("KafkaConsumer close");
        rd_kafka_resp_err_t err = rd_kafka_consumer_close(consumer_);
        if (err) {
            SPDLOG_WARN("KafkaConsumer close returned: {}", rd_kafka_err2str(err));
        }
        rd_kafka_destroy(consumer_);
        consumer_ = nullptr;
    }
    subscribed_topics_.clear();
    initialized_ = false;
}

bool KafkaConsumer::is_initialized() const {
    std::shared_lock lock(consumer_mutex_);
    return initialized_;
}

} // namespace book_watch
