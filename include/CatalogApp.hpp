// include/CatalogApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/AuthSettings.hpp"
#include "settings/PaginationSettings.hpp"

// Ports
#include "ports/input/ITokenService.hpp"
#include "ports/input/IAuthContext.hpp"
#include "ports/input/IUserService.hpp"
#include "ports/input/IBookService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "ports/output/ITokenRepository.hpp"
#include "ports/output/IBookRepository.hpp"

// Application
#include "application/TokenService.hpp"
#include "application/AuthContext.hpp"
#include "application/UserService.hpp"
#include "application/BookService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresUserRepository.hpp"
#include "adapters/secondary/PostgresTokenRepository.hpp"
#include "adapters/secondary/PostgresBookRepository.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/AuthenticationMiddleware.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RegisterUserHandler.hpp"
#include "adapters/primary/ActivateUserHandler.hpp"
#include "adapters/primary/CreateAuthenticationTokenHandler.hpp"
#include "adapters/primary/ListBooksHandler.hpp"
#include "adapters/primary/GetBookHandler.hpp"
#include "adapters/primary/CreateBookHandler.hpp"
#include "adapters/primary/UpdateBookHandler.hpp"
#include "adapters/primary/DeleteBookHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace catalog
{

    /**
     * @brief Catalog Service Application
     *
     * Пользователи и токены: /v1/users, /v1/tokens/authentication
     * Каталог книг: /v1/books (только с Bearer токеном,
     * изменения только для активированных пользователей)
     */
    class CatalogApp : public BoostBeastApplication
    {
    public:
        CatalogApp() { std::cout << "[CatalogApp] Initializing..." << std::endl; }
        ~CatalogApp() override { std::cout << "[CatalogApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[CatalogApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[CatalogApp] Configuring DI..." << std::endl;

            // Шаг 1: injector
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::AuthSettings>().in(di::singleton),
                di::bind<settings::PaginationSettings>().in(di::singleton),

                di::bind<ports::output::IUserRepository>()
                    .to<adapters::secondary::PostgresUserRepository>()
                    .in(di::singleton),
                di::bind<ports::output::ITokenRepository>()
                    .to<adapters::secondary::PostgresTokenRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IBookRepository>()
                    .to<adapters::secondary::PostgresBookRepository>()
                    .in(di::singleton),

                di::bind<ports::input::ITokenService>().to<application::TokenService>().in(di::singleton),
                di::bind<ports::input::IAuthContext>().to<application::AuthContext>().in(di::singleton),
                di::bind<ports::input::IUserService>().to<application::UserService>().in(di::singleton),
                di::bind<ports::input::IBookService>().to<application::BookService>().in(di::singleton));

            // Шаг 2: публичные handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            handlers_[getHandlerKey("POST", "/v1/users")] =
                injector.create<std::shared_ptr<adapters::primary::RegisterUserHandler>>();
            handlers_[getHandlerKey("PUT", "/v1/users/activated")] =
                injector.create<std::shared_ptr<adapters::primary::ActivateUserHandler>>();
            handlers_[getHandlerKey("POST", "/v1/tokens/authentication")] =
                injector.create<std::shared_ptr<adapters::primary::CreateAuthenticationTokenHandler>>();

            // Шаг 3: каталог за middleware
            auto authMw = injector.create<std::shared_ptr<adapters::primary::AuthenticationMiddleware>>();
            auto activatedMw = std::make_shared<adapters::primary::ActivatedUserMiddleware>();

            auto listBooks = injector.create<std::shared_ptr<adapters::primary::ListBooksHandler>>();
            auto getBook = injector.create<std::shared_ptr<adapters::primary::GetBookHandler>>();
            auto createBook = injector.create<std::shared_ptr<adapters::primary::CreateBookHandler>>();
            auto updateBook = injector.create<std::shared_ptr<adapters::primary::UpdateBookHandler>>();
            auto deleteBook = injector.create<std::shared_ptr<adapters::primary::DeleteBookHandler>>();

            using adapters::primary::ChainHandler;
            handlers_[getHandlerKey("GET", "/v1/books")] = std::make_shared<ChainHandler>(authMw, listBooks);
            handlers_[getHandlerKey("GET", "/v1/books/*")] = std::make_shared<ChainHandler>(authMw, getBook);
            handlers_[getHandlerKey("POST", "/v1/books")] =
                std::make_shared<ChainHandler>(authMw, activatedMw, createBook);
            handlers_[getHandlerKey("PATCH", "/v1/books/*")] =
                std::make_shared<ChainHandler>(authMw, activatedMw, updateBook);
            handlers_[getHandlerKey("DELETE", "/v1/books/*")] =
                std::make_shared<ChainHandler>(authMw, activatedMw, deleteBook);

            // Шаг 4: чистка истёкших токенов перед стартом
            auto tokenService = injector.create<std::shared_ptr<ports::input::ITokenService>>();
            try {
                tokenService->purgeExpired();
            } catch (const domain::DomainError& e) {
                std::cerr << "[CatalogApp] Expired token purge failed (" << domain::toString(e.kind())
                          << "): " << e.what() << std::endl;
            }

            std::cout << "[CatalogApp] Ready" << std::endl;
        }
    };

} // namespace catalog
