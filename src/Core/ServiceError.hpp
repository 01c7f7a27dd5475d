/*
 * JitGuard - Endpoint Privilege Elevation Service
 * Copyright (C) 2026 JitGuard Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

/**
 * @file ServiceError.hpp
 * @brief Error taxonomy shared by every JitGuard module.
 *
 * Operations report failures through an optional ServiceError* out-parameter
 * and a bool / std::optional return. No exception crosses a module boundary.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace JitGuard {

	namespace Database {
		struct DatabaseError;
	}

	namespace Core {

		enum class ErrorKind : uint8_t {
			None = 0,
			AccessDenied,       ///< Policy said Deny, no active profile, caller not allowed
			NotFound,           ///< Referenced profile / rule / log id absent
			InvalidParameter,   ///< Malformed request, out-of-range value, dangling reference
			Internal,           ///< Repository / storage failure
			Cancelled           ///< Caller aborted an in-flight operation
		};

		[[nodiscard]] std::string_view GetErrorKindName(ErrorKind kind) noexcept;

		struct ServiceError {
			ErrorKind kind = ErrorKind::None;
			int32_t platformCode = 0;       ///< Secondary diagnostic code (SQLite rc, OS error)
			std::wstring message;
			std::wstring context;           ///< Operation that failed

			[[nodiscard]] bool HasError() const noexcept { return kind != ErrorKind::None; }

			void Clear() noexcept {
				kind = ErrorKind::None;
				platformCode = 0;
				message.clear();
				context.clear();
			}
		};

		/// @brief Fills err if non-null. Returns false so callers can `return SetError(...)`.
		bool SetError(ServiceError* err, ErrorKind kind, std::wstring_view message,
		              std::wstring_view context = {}, int32_t platformCode = 0);

		/// @brief Maps a storage failure to Internal with the SQLite code as platformCode.
		bool SetStorageError(ServiceError* err, const Database::DatabaseError& dbErr,
		                     std::wstring_view context);

	}  // namespace Core
}  // namespace JitGuard
