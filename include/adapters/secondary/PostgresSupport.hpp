#pragma once

#include "domain/DomainError.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>
#include <utility>

namespace catalog::adapters::secondary {

/**
 * @brief Выполнить операцию в отдельной транзакции с statement_timeout
 *
 * Соединение открывается на каждую операцию, общего состояния между
 * запросами нет. Тело само вызывает commit() для записи.
 * Исключения libpqxx переводятся в DomainError:
 * - unique_violation  -> CONFLICT
 * - query_canceled    -> TIMEOUT (statement_timeout истёк)
 * - остальное         -> STORAGE
 * Детали пишутся в stderr, наружу уходит только общий текст.
 */
template <typename Body>
auto withTransaction(const settings::DbSettings& settings, const char* component, Body&& body)
    -> decltype(body(std::declval<pqxx::work&>()))
{
    try {
        pqxx::connection connection(settings.getConnectionString());
        pqxx::work txn(connection);
        txn.exec("SET LOCAL statement_timeout = " + std::to_string(settings.getTimeoutMs()));
        return body(txn);
    } catch (const domain::DomainError&) {
        throw;
    } catch (const pqxx::unique_violation& e) {
        std::cerr << "[" << component << "] unique violation: " << e.what() << std::endl;
        throw domain::DomainError::conflict("duplicate key");
    } catch (const pqxx::query_canceled& e) {
        std::cerr << "[" << component << "] statement timeout: " << e.what() << std::endl;
        throw domain::DomainError(domain::ErrorKind::TIMEOUT, "storage operation timed out");
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[" << component << "] connection failed: " << e.what() << std::endl;
        throw domain::DomainError(domain::ErrorKind::STORAGE, "storage unavailable");
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] query failed: " << e.what() << std::endl;
        throw domain::DomainError(domain::ErrorKind::STORAGE, "storage error");
    }
}

} // namespace catalog::adapters::secondary
