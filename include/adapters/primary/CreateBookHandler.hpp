#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBookService.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace catalog::adapters::primary {

/**
 * @brief POST /v1/books
 * {
 *   "title": "Dune",
 *   "author": "Frank Herbert",
 *   "publishedYear": 1965
 * }
 */
class CreateBookHandler : public IHttpHandler {
public:
    explicit CreateBookHandler(std::shared_ptr<ports::input::IBookService> bookService)
        : bookService_(std::move(bookService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            auto book = bookService_->createBook(
                body.value("title", ""),
                body.value("author", ""),
                body.value("publishedYear", 0)
            );

            nlohmann::json response;
            response["book"] = bookToJson(book);
            res.setResult(201, "application/json", response.dump());
            res.setHeader("Location", "/v1/books/" + std::to_string(book.id));

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "CreateBookHandler");
        } catch (const std::exception& e) {
            std::cerr << "[CreateBookHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IBookService> bookService_;
};

} // namespace catalog::adapters::primary
