#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <iostream>
#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

// Sends the three canonical frames (single message, flagged bundle, timed
// bundle) to a running bridge. Run monitor_example to watch the result.
int main(int argc, char *argv[]) {
    std::string url = argc > 1 ? argv[1] : "ws://localhost:8080";

    ix::initNetSystem();

    ix::WebSocket webSocket;
    webSocket.setUrl(url);
    webSocket.disableAutomaticReconnection();

    std::mutex mutex;
    std::condition_variable cv;
    bool opened = false;
    bool failed = false;
    std::string error;

    webSocket.setOnMessageCallback([&](const ix::WebSocketMessagePtr &msg) {
        std::lock_guard<std::mutex> lock(mutex);
        if (msg->type == ix::WebSocketMessageType::Open) {
            opened = true;
        } else if (msg->type == ix::WebSocketMessageType::Error) {
            failed = true;
            error = msg->errorInfo.reason;
        } else {
            return;
        }
        cv.notify_all();
    });

    std::cout << "Connecting to " << url << "..." << std::endl;
    webSocket.start();

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(5), [&] { return opened || failed; });
        if (!opened) {
            std::cerr << "Failed to connect: " << (failed ? error : "timed out") << std::endl;
            webSocket.stop();
            ix::uninitNetSystem();
            return 1;
        }
    }
    std::cout << "Connected." << std::endl;

    auto packet = [](const std::string &address, const nlohmann::json &args) {
        nlohmann::json object;
        object["address"] = address;
        object["args"] = args;
        return object;
    };

    // Frame 1: a single message
    nlohmann::json single =
        packet("/tuio/2Dcur", nlohmann::json::array({"source", "TuioBridge@example"}));

    // Frame 2: a flagged bundle carrying one full TUIO cursor frame
    nlohmann::json bundle;
    bundle["bundle"] = true;
    bundle["packets"] = nlohmann::json::array(
        {packet("/tuio/2Dcur", nlohmann::json::array({"source", "TuioBridge@example"})),
         packet("/tuio/2Dcur", nlohmann::json::array({"set", 1, 0.5, 0.5, 0.0, 0.0, 0.0})),
         packet("/tuio/2Dcur", nlohmann::json::array({"alive", 1})),
         packet("/tuio/2Dcur", nlohmann::json::array({"fseq", 1}))});

    // Frame 3: a timed bundle; the time tag is logged by the bridge but not encoded
    int64_t nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    nlohmann::json timed;
    timed["timeTag"] = nowMs;
    timed["packets"] = nlohmann::json::array(
        {packet("/tuio/2Dcur", nlohmann::json::array({"set", 2, 0.3, 0.7, 0.1, -0.1, 0.0}))});

    int exitCode = 0;
    for (const auto &frame : std::vector<nlohmann::json>{single, bundle, timed}) {
        std::string text = frame.dump();
        ix::WebSocketSendInfo info = webSocket.send(text);
        if (!info.success) {
            std::cerr << "Failed to send: " << text << std::endl;
            exitCode = 1;
            break;
        }
        std::cout << "Sent: " << text << std::endl;
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    webSocket.stop();
    ix::uninitNetSystem();

    std::cout << "Client example completed." << std::endl;
    return exitCode;
}
