#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBookService.hpp"
#include "settings/PaginationSettings.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include "adapters/primary/RequestReaders.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace catalog::adapters::primary {

/**
 * @brief GET /v1/books?title=&author=&page=1&page_size=20&sort=-title
 *
 * Response:
 * {
 *   "books": [ ... ],
 *   "metadata": { "current_page": 1, "page_size": 20, "first_page": 1,
 *                 "last_page": 3, "total_records": 57 }
 * }
 */
class ListBooksHandler : public IHttpHandler {
public:
    ListBooksHandler(
        std::shared_ptr<settings::PaginationSettings> settings,
        std::shared_ptr<ports::input::IBookService> bookService
    ) : settings_(std::move(settings))
      , bookService_(std::move(bookService))
    {
        std::cout << "[ListBooksHandler] Created" << std::endl;
    }

    static const domain::SortSafelist& sortSafelist() {
        static const domain::SortSafelist safelist =
            domain::SortSafelist::bothDirections({"id", "title", "author", "published_year"});
        return safelist;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            domain::Validator v;
            auto title = readString(req, "title", "");
            auto author = readString(req, "author", "");

            domain::Filters filters;
            filters.page = readInt(req, "page", 1, v);
            filters.pageSize = readInt(req, "page_size", settings_->getDefaultPageSize(), v);
            filters.sort = readString(req, "sort", "id");
            filters.sortSafelist = sortSafelist();
            v.throwIfInvalid();

            auto page = bookService_->listBooks(title, author, filters);

            nlohmann::json response;
            response["books"] = nlohmann::json::array();
            for (const auto& book : page.books) {
                response["books"].push_back(bookToJson(book));
            }
            response["metadata"] = metadataToJson(page.metadata);

            res.setResult(200, "application/json", response.dump());

        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "ListBooksHandler");
        } catch (const std::exception& e) {
            std::cerr << "[ListBooksHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<settings::PaginationSettings> settings_;
    std::shared_ptr<ports::input::IBookService> bookService_;
};

} // namespace catalog::adapters::primary
