#include "ppeguard/mqtt_notifier.hpp"
#include "ppeguard/common.hpp"
#include "ppeguard/json.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <mosquitto.h>

namespace ppeguard {

struct MqttNotifier::Impl {
    Impl(MqttConfig cfg, std::string service)
        : config(std::move(cfg)), service_name(std::move(service)) {
        if (config.server.empty()) {
            std::cout << "[MQTT] No broker configured, alerts will only be logged" << std::endl;
            return;
        }

        mosquitto_lib_init();
        lib_initialized = true;
        const char* client_id = config.client_id.empty() ? nullptr : config.client_id.c_str();
        client.reset(mosquitto_new(client_id, true, this));
        if (!client) {
            mosquitto_lib_cleanup();
            lib_initialized = false;
            throw std::runtime_error("Failed to create MQTT client");
        }

        mosquitto_connect_callback_set(client.get(), &Impl::onConnect);
        mosquitto_disconnect_callback_set(client.get(), &Impl::onDisconnect);
        mosquitto_reconnect_delay_set(client.get(), 1, 8, true);

        if (!config.username.empty()) {
            const char* password = config.password.empty() ? nullptr : config.password.c_str();
            int rc = mosquitto_username_pw_set(client.get(), config.username.c_str(), password);
            if (rc != MOSQ_ERR_SUCCESS) {
                client.reset();
                mosquitto_lib_cleanup();
                lib_initialized = false;
                throw std::runtime_error(std::string("Failed to set MQTT credentials: ") + mosquitto_strerror(rc));
            }
        } else if (!config.password.empty()) {
            client.reset();
            mosquitto_lib_cleanup();
            lib_initialized = false;
            throw std::runtime_error("MQTT password provided without username");
        }

        // The broker announces us offline if the connection drops without a goodbye.
        if (!config.status_topic.empty()) {
            std::string will = statusPayload("offline");
            mosquitto_will_set(client.get(), config.status_topic.c_str(), static_cast<int>(will.size()),
                               will.data(), config.qos, true);
        }
    }

    ~Impl() {
        stop();
        client.reset();
        if (lib_initialized) {
            mosquitto_lib_cleanup();
        }
    }

    void start() {
        if (!client || running) {
            return;
        }
        int port = config.port > 0 ? config.port : 1883;
        int keep_alive = config.keep_alive > 0 ? config.keep_alive : 60;
        int rc = mosquitto_connect_async(client.get(), config.server.c_str(), port, keep_alive);
        if (rc != MOSQ_ERR_SUCCESS) {
            // The network loop keeps retrying with the reconnect delay.
            std::cerr << "[MQTT] Initial connect to " << config.server << ":" << port
                      << " failed: " << mosquitto_strerror(rc) << std::endl;
        }
        rc = mosquitto_loop_start(client.get());
        if (rc != MOSQ_ERR_SUCCESS) {
            throw std::runtime_error(std::string("Failed to start MQTT network loop: ") + mosquitto_strerror(rc));
        }
        running = true;
    }

    void stop() {
        if (!client || !running) {
            return;
        }
        if (connected.load()) {
            publish(config.status_topic, statusPayload("offline"), true);
        }
        mosquitto_disconnect(client.get());
        mosquitto_loop_stop(client.get(), false);
        running = false;
        connected.store(false);
    }

    std::string statusPayload(const std::string& state) const {
        Json payload = Json::object();
        payload["type"] = "service_status";
        payload["state"] = state;
        payload["service_name"] = service_name;
        payload["client_id"] = config.client_id;
        payload["timestamp"] = isoTimestamp(Clock::now());
        return payload.dump(-1);
    }

    bool publish(const std::string& topic, const std::string& payload, bool retain) {
        if (topic.empty()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(publish_mutex);
        int rc = mosquitto_publish(client.get(), nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), config.qos, retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to publish to " << topic << ": " << mosquitto_strerror(rc) << std::endl;
            return false;
        }
        return true;
    }

    bool sendAlert(const std::string& text) {
        if (!client) {
            std::cout << "[MQTT] (disabled) " << text << std::endl;
            return false;
        }
        Json payload = Json::object();
        payload["type"] = "ppe_alert";
        payload["service_name"] = service_name;
        payload["client_id"] = config.client_id;
        payload["timestamp"] = isoTimestamp(Clock::now());
        payload["message"] = text;
        return publish(config.alert_topic, payload.dump(-1), false);
    }

    static void onConnect(struct mosquitto* mosq, void* userdata, int rc) {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        if (rc == 0) {
            self->connected.store(true);
            self->publish(self->config.status_topic, self->statusPayload("online"), true);
            std::cout << "[MQTT] Connected to " << self->config.server << std::endl;
        } else {
            std::cerr << "[MQTT] Connect failed: " << mosquitto_connack_string(rc) << std::endl;
        }
    }

    static void onDisconnect(struct mosquitto* mosq, void* userdata, int rc) {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        self->connected.store(false);
        if (rc != 0) {
            std::cerr << "[MQTT] Unexpected disconnect: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    MqttConfig config;
    std::string service_name;
    std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)> client{nullptr, mosquitto_destroy};
    std::atomic<bool> connected{false};
    std::mutex publish_mutex;
    bool lib_initialized = false;
    bool running = false;
};

MqttNotifier::MqttNotifier(MqttConfig config, std::string service_name)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(service_name))) {}

MqttNotifier::~MqttNotifier() = default;

void MqttNotifier::start() {
    impl_->start();
}

void MqttNotifier::stop() {
    impl_->stop();
}

bool MqttNotifier::send(const std::string& text) {
    return impl_->sendAlert(text);
}

bool MqttNotifier::enabled() const {
    return static_cast<bool>(impl_->client);
}

bool MqttNotifier::connected() const {
    return impl_->connected.load();
}

}  // namespace ppeguard
