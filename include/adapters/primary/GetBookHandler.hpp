#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBookService.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestReaders.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace catalog::adapters::primary {

/**
 * @brief GET /v1/books/{id}
 *
 * Роутер регистрирует с паттерном "/v1/books/*"
 */
class GetBookHandler : public IHttpHandler {
public:
    explicit GetBookHandler(std::shared_ptr<ports::input::IBookService> bookService)
        : bookService_(std::move(bookService)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto id = readIdParam(req);
        if (!id) {
            sendError(res, 404, "the requested resource could not be found");
            return;
        }

        try {
            auto book = bookService_->getBook(*id);

            nlohmann::json response;
            response["book"] = bookToJson(book);
            res.setResult(200, "application/json", response.dump());

        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "GetBookHandler");
        } catch (const std::exception& e) {
            std::cerr << "[GetBookHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IBookService> bookService_;
};

} // namespace catalog::adapters::primary
