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
 * @brief PATCH /v1/books/{id}
 *
 * Тело — любые из полей title, author, publishedYear.
 * Заголовок X-Expected-Version (необязательный): версия, которую
 * клиент прочитал. Расхождение -> 409.
 */
class UpdateBookHandler : public IHttpHandler {
public:
    explicit UpdateBookHandler(std::shared_ptr<ports::input::IBookService> bookService)
        : bookService_(std::move(bookService)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto id = readIdParam(req);
        if (!id) {
            sendError(res, 404, "the requested resource could not be found");
            return;
        }

        std::optional<int32_t> expectedVersion;
        if (auto header = req.getHeader("X-Expected-Version"); header && !header->empty()) {
            try {
                std::size_t pos = 0;
                expectedVersion = std::stoi(*header, &pos);
                if (pos != header->size()) {
                    throw std::invalid_argument(*header);
                }
            } catch (const std::exception&) {
                sendError(res, 400, "X-Expected-Version must be an integer");
                return;
            }
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.is_object()) {
                sendError(res, 400, "Invalid JSON");
                return;
            }

            domain::BookPatch patch;
            if (body.contains("title")) patch.title = body["title"].get<std::string>();
            if (body.contains("author")) patch.author = body["author"].get<std::string>();
            if (body.contains("publishedYear")) patch.publishedYear = body["publishedYear"].get<int32_t>();

            auto book = bookService_->updateBook(*id, patch, expectedVersion);

            nlohmann::json response;
            response["book"] = bookToJson(book);
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "UpdateBookHandler");
        } catch (const std::exception& e) {
            std::cerr << "[UpdateBookHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IBookService> bookService_;
};

} // namespace catalog::adapters::primary
