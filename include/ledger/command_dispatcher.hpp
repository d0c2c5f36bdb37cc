#pragma once

#include "ledger/engine.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ledger {

// Maps JSON requests of the form
//   {"command": "...", "ctx": {"tenant_id": "...", "user_id": 1}, ...}
// onto the engine and shapes every outcome as
//   {"ok": true, "result": ...} or {"ok": false, "error": <code>, "message": ...}.
// A request "id" is echoed back unchanged.
class CommandDispatcher {
public:
    explicit CommandDispatcher(Engine& engine);

    nlohmann::json handle(const nlohmann::json& request);

    // Parses one line of input first; malformed JSON becomes a bad_request reply.
    nlohmann::json handle_line(const std::string& line);

    [[nodiscard]] std::vector<std::string> commands() const;

private:
    using Handler = std::function<nlohmann::json(const CallerContext&, const nlohmann::json&)>;

    void register_handlers();

    Engine& engine_;
    std::map<std::string, Handler> handlers_;
};

} // namespace ledger
