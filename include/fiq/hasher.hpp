// ==============================================================================
// fiq/hasher.hpp - Отпечаток содержимого файла (SHA-256)
// ==============================================================================
//
// Политика чтения:
// - пустой файл -> отпечаток пустого ввода, файл не открывается
// - < MMAP_THRESHOLD -> чтение целиком
// - >= MMAP_THRESHOLD -> read-only mmap, хеширование на месте
//
// Отпечаток: 64 символа lowercase hex.
//
// ==============================================================================

#ifndef FIQ_HASHER_HPP
#define FIQ_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fiq::hash {

/// Длина отпечатка в hex-символах
constexpr std::size_t FINGERPRINT_HEX_LENGTH = 64;

/// SHA-256 от байтов в hex
/// @throws std::runtime_error если OpenSSL не смог посчитать digest
std::string hash_bytes(std::string_view bytes);

/// Отпечаток пустого ввода
const std::string& empty_fingerprint();

/// Отпечаток файла известного размера.
/// nullopt при любой ошибке ввода-вывода или отображения.
std::optional<std::string> hash_file(const std::filesystem::path& path, std::uint64_t size);

}  // namespace fiq::hash

#endif  // FIQ_HASHER_HPP
