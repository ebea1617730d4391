#pragma once

namespace reldb::storage {
class Database;
}

namespace reldb::executor {

class ExecutorTelemetry;

struct ExecutorContextConfig final {
    storage::Database* database = nullptr;
    ExecutorTelemetry* telemetry = nullptr;
};

class ExecutorContext final {
public:
    ExecutorContext();
    explicit ExecutorContext(ExecutorContextConfig config);

    [[nodiscard]] storage::Database* database() const noexcept;
    [[nodiscard]] ExecutorTelemetry* telemetry() const noexcept;

private:
    ExecutorContextConfig config_{};
};

}  // namespace reldb::executor
