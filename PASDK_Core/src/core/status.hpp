#pragma once

// ==============================
// PASDK - Status Codes & Result
// ==============================
// Every fallible operation in the core reports a Status instead of
// throwing. Result<T> pairs a status with a value.

#include <cstdint>

namespace PASDK {

enum class Status : uint32_t {
	OK = 0,

	// Arguments
	InvalidArgs,

	// Discovery
	TypeNotFound,
	AmbiguousType,
	MethodNotFound,
	FieldNotFound,
	ModuleNotFound,

	// Runtime module / exports
	GameModuleNotFound,
	ExportNotFound,

	// Persistent cache
	CacheCorrupted,
	CacheVersionMismatch,
	IoError,

	// Overrides
	ValidationFailed,
	TypeMismatch,
	CapabilityNotFound,

	// Hooks
	HookBackendUnavailable,
	HookCreateFailed,
	HookEnableFailed,

	// Lifecycle
	NotInitialized,
	AlreadyInitialized,
	InternalError,
};

template <typename T>
struct Result {
	Status status{ Status::OK };
	T      value{};
	explicit operator bool() const { return status == Status::OK; }
};

template <>
struct Result<void> {
	Status status{ Status::OK };
	explicit operator bool() const { return status == Status::OK; }
};

inline const char* to_string(Status s) {
	switch (s) {
	case Status::OK: return "OK";
	case Status::InvalidArgs: return "InvalidArgs";
	case Status::TypeNotFound: return "TypeNotFound";
	case Status::AmbiguousType: return "AmbiguousType";
	case Status::MethodNotFound: return "MethodNotFound";
	case Status::FieldNotFound: return "FieldNotFound";
	case Status::ModuleNotFound: return "ModuleNotFound";
	case Status::GameModuleNotFound: return "GameModuleNotFound";
	case Status::ExportNotFound: return "ExportNotFound";
	case Status::CacheCorrupted: return "CacheCorrupted";
	case Status::CacheVersionMismatch: return "CacheVersionMismatch";
	case Status::IoError: return "IoError";
	case Status::ValidationFailed: return "ValidationFailed";
	case Status::TypeMismatch: return "TypeMismatch";
	case Status::CapabilityNotFound: return "CapabilityNotFound";
	case Status::HookBackendUnavailable: return "HookBackendUnavailable";
	case Status::HookCreateFailed: return "HookCreateFailed";
	case Status::HookEnableFailed: return "HookEnableFailed";
	case Status::NotInitialized: return "NotInitialized";
	case Status::AlreadyInitialized: return "AlreadyInitialized";
	case Status::InternalError: return "InternalError";
	default: return "Unknown";
	}
}

} // namespace PASDK
