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
#include "ServiceError.hpp"
#include "../Database/DatabaseManager.hpp"

namespace JitGuard {
	namespace Core {

		std::string_view GetErrorKindName(ErrorKind kind) noexcept {
			switch (kind) {
			case ErrorKind::None:             return "None";
			case ErrorKind::AccessDenied:     return "AccessDenied";
			case ErrorKind::NotFound:         return "NotFound";
			case ErrorKind::InvalidParameter: return "InvalidParameter";
			case ErrorKind::Internal:         return "Internal";
			case ErrorKind::Cancelled:        return "Cancelled";
			default:                          return "Unknown";
			}
		}

		bool SetError(ServiceError* err, ErrorKind kind, std::wstring_view message,
			std::wstring_view context, int32_t platformCode) {
			if (err) {
				err->kind = kind;
				err->platformCode = platformCode;
				err->message.assign(message);
				err->context.assign(context);
			}
			return false;
		}

		bool SetStorageError(ServiceError* err, const Database::DatabaseError& dbErr,
			std::wstring_view context) {
			std::wstring message = dbErr.message.empty() ? std::wstring(L"Storage failure") : dbErr.message;
			return SetError(err, ErrorKind::Internal, message, context,
				dbErr.extendedCode != 0 ? dbErr.extendedCode : dbErr.sqliteCode);
		}

	}  // namespace Core
}  // namespace JitGuard
