#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorResponder.hpp"
#include <iostream>
#include <memory>
#include <vector>

namespace catalog::adapters::primary {

/**
 * @brief Маршрут каталога: проверки доступа, затем handler
 *
 * Например: AuthenticationMiddleware -> ActivatedUserMiddleware -> CreateBookHandler.
 * Шаг, после которого статус ответа остался 0, передаёт запрос следующему.
 * Первый шаг, выставивший статус, завершает маршрут.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Steps>
    explicit ChainHandler(Steps&&... steps) {
        steps_.reserve(sizeof...(steps));
        (steps_.push_back(std::forward<Steps>(steps)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (const auto& step : steps_) {
            step->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        // Последний шаг обязан ответить
        std::cerr << "[ChainHandler] " << req.getMethod() << " " << req.getPath()
                  << " left without a response" << std::endl;
        sendError(res, 500, "Internal server error");
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> steps_;
};

} // namespace catalog::adapters::primary
