#ifndef SPVD_ROUTER_HPP
#define SPVD_ROUTER_HPP
#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace spvd {
    class request_handler;

    // Maps external method names onto request_handler calls and wraps
    // their results in a response envelope:
    //   {"status": "ok", "code": 0, "result": ...}
    //   {"status": "error", "code": <SPVD_*>, "error": "..."}
    class request_router final {
    public:
        explicit request_router(request_handler& handler);

        request_router(const request_router&) = delete;
        request_router& operator=(const request_router&) = delete;

        nlohmann::json call(const std::string& method, const nlohmann::json& params);

        // Dispatch a {"method": ..., "params": ...} request
        nlohmann::json call(const nlohmann::json& request);

        std::vector<std::string> get_methods() const;

    private:
        using method_t = std::function<nlohmann::json(const nlohmann::json&)>;

        void add_methods();

        request_handler& m_handler;
        std::map<std::string, method_t> m_methods;
    };

} // namespace spvd

#endif
