/**
 * @file    KafkaProducer.cpp
 * @brief   Kafka producer singleton implementation using librdkafka.
 */

#include "KafkaProducer.hpp"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace book_watch {

KafkaProducer& KafkaProducer::instance() {
    static KafkaProducer instance;
    return instance;
}

KafkaProducer::KafkaProducer()
    : producer_(nullptr), initialized_(false) {}

KafkaProducer::~KafkaProducer() {
    shutdown();
}

void KafkaProducer::initialize(const std::string& config_path) {
    std::unique_lock lock(producer_mutex_);
    if (initialized_) return; // Already initialized
    parse_config(config_path);

    char errstr[512];
    rd_kafka_conf_t* conf = rd_kafka_conf_new();

    if (rd_kafka_conf_set(conf, "bootstrap.servers", bootstrap_servers_.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        rd_kafka_conf_destroy(conf);
        throw std::runtime_error("Failed to set bootstrap.servers: " + std::string(errstr));
    }
    if (rd_kafka_conf_set(conf, "linger.ms", linger_ms_.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        SPDLOG_WARN("KafkaProducer ignoring linger.ms={}: {}", linger_ms_, errstr);
    }
    if (rd_kafka_conf_set(conf, "acks", acks_.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        SPDLOG_WARN("KafkaProducer ignoring acks={}: {}", acks_, errstr);
    }
    rd_kafka_conf_set_dr_msg_cb(conf, &KafkaProducer::delivery_report);

    producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!producer_) {
        rd_kafka_conf_destroy(conf);
        throw std::runtime_error("Failed to create Kafka producer: " + std::string(errstr));
    }

    initialized_ = true;
    SPDLOG_INFO("KafkaProducer initialized (bootstrap={})", bootstrap_servers_);
}

void KafkaProducer::parse_config(const std::string& config_path) {
    SPDLOG_INFO("KafkaProducer loading config file: {}", config_path);
    YAML::Node config = YAML::LoadFile(config_path);

    auto kafka = config["kafka_producer"];
    if (!kafka)
        throw std::runtime_error("KafkaProducer config: missing 'kafka_producer' node");

    bootstrap_servers_ = kafka["bootstrap_servers"] ? kafka["bootstrap_servers"].as<std::string>() : "localhost:9092";
    linger_ms_         = kafka["linger_ms"]         ? std::to_string(kafka["linger_ms"].as<int>())  : "5";
    acks_              = kafka["acks"]              ? kafka["acks"].as<std::string>()              : "1";
}

rd_kafka_t* KafkaProducer::get_producer() {
    std::shared_lock lock(producer_mutex_);
    return producer_;
}

rd_kafka_topic_t* KafkaProducer::get_or_create_topic(const std::string& topic) {
    // First try with shared lock for read
    {
        std::shared_lock lock(producer_mutex_);
        if (!producer_) return nullptr;
        auto it = topics_.find(topic);
        if (it != topics_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(producer_mutex_);
    if (!producer_) return nullptr;

    // Double-check pattern
    auto it = topics_.find(topic);
    if (it != topics_.end()) {
        return it->second;
    }

    rd_kafka_topic_t* handle = rd_kafka_topic_new(producer_, topic.c_str(), nullptr);
    if (!handle) {
        SPDLOG_ERROR("Failed to create topic handle {}: {}", topic, rd_kafka_err2str(rd_kafka_last_error()));
        return nullptr;
    }
    topics_[topic] = handle;
    SPDLOG_DEBUG("Created topic handle: {}", topic);
    return handle;
}

void KafkaProducer::poll(int timeout_ms) {
    std::shared_lock lock(producer_mutex_);
    if (producer_) {
        rd_kafka_poll(producer_, timeout_ms);
    }
}

void KafkaProducer::shutdown() {
    std::unique_lock lock(producer_mutex_);
    if (producer_) {
        SPDLOG_INFO("KafkaProducer flush and close");
        rd_kafka_resp_err_t err = rd_kafka_flush(producer_, 5000);
        if (err) {
            SPDLOG_WARN("KafkaProducer flush incomplete: {}", rd_kafka_err2str(err));
        }
        for (auto& [name, handle] : topics_) {
            rd_kafka_topic_destroy(handle);
        }
        topics_.clear();
        rd_kafka_destroy(producer_);
        producer_ = nullptr;
    }
    initialized_ = false;
}

void KafkaProducer::delivery_report(rd_kafka_t* /*rk*/, const rd_kafka_message_t* msg, void* /*opaque*/) {
    if (msg->err) {
        SPDLOG_WARN("Delivery failed for topic {}: {}",
                    rd_kafka_topic_name(msg->rkt), rd_kafka_err2str(msg->err));
    }
}

} // namespace book_watch
