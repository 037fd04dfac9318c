#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: result.hpp
    MODULE: core
    PURPOSE: Error taxonomy and the Result/Status return types used across the library.
            Nothing in the core throws across its API; failures travel as values.
*/


#include <cstdint>
#include <string>
#include <utility>

namespace sbg
{
    enum class ErrorKind : uint8_t
    {
        None = 0,
        Config = 1,
        Build = 2,
        Compile = 3,
        RuntimeGpu = 4,
        Io = 5
    };

    enum class ErrorCode : uint16_t
    {
        None = 0,
        TomlParse,
        WrongValueType,
        InvalidEnumValue,
        OutOfRangeValue,
        InvalidDuration,
        InvalidInputReference,
        InvalidInputSlot,
        DanglingBufferReference,
        CyclicCurrentFrameDependency,
        CurrentFrameOrderViolation,
        ShaderCompileFailed,
        FallbackShaderFailed,
        ResourceAllocationFailed,
        GpuDrawFailed,
        GpuErrorThresholdExceeded,
        FileRead
    };

    inline const char* error_kind_name(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::None: return "none";
            case ErrorKind::Config: return "ConfigError";
            case ErrorKind::Build: return "BuildError";
            case ErrorKind::Compile: return "CompileError";
            case ErrorKind::RuntimeGpu: return "RuntimeGPUError";
            case ErrorKind::Io: return "IoError";
        }
        return "unknown";
    }

    inline const char* error_code_name(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::None: return "none";
            case ErrorCode::TomlParse: return "TomlParse";
            case ErrorCode::WrongValueType: return "WrongValueType";
            case ErrorCode::InvalidEnumValue: return "InvalidEnumValue";
            case ErrorCode::OutOfRangeValue: return "OutOfRangeValue";
            case ErrorCode::InvalidDuration: return "InvalidDuration";
            case ErrorCode::InvalidInputReference: return "InvalidInputReference";
            case ErrorCode::InvalidInputSlot: return "InvalidInputSlot";
            case ErrorCode::DanglingBufferReference: return "DanglingBufferReference";
            case ErrorCode::CyclicCurrentFrameDependency: return "CyclicCurrentFrameDependency";
            case ErrorCode::CurrentFrameOrderViolation: return "CurrentFrameOrderViolation";
            case ErrorCode::ShaderCompileFailed: return "ShaderCompileFailed";
            case ErrorCode::FallbackShaderFailed: return "FallbackShaderFailed";
            case ErrorCode::ResourceAllocationFailed: return "ResourceAllocationFailed";
            case ErrorCode::GpuDrawFailed: return "GpuDrawFailed";
            case ErrorCode::GpuErrorThresholdExceeded: return "GpuErrorThresholdExceeded";
            case ErrorCode::FileRead: return "FileRead";
        }
        return "unknown";
    }

    struct Error
    {
        ErrorKind kind = ErrorKind::None;
        ErrorCode code = ErrorCode::None;
        std::string message{};
        // Pass identifier the error is attached to, empty for preset-wide errors.
        std::string pass{};
        // Source line for compile errors, 0 when unknown.
        int line = 0;

        std::string describe() const
        {
            std::string out = std::string(error_kind_name(kind)) + "/" + error_code_name(code);
            if (!pass.empty()) out += " [" + pass + "]";
            if (line > 0) out += " line " + std::to_string(line);
            if (!message.empty()) out += ": " + message;
            return out;
        }
    };

    inline Error make_error(ErrorKind kind, ErrorCode code, std::string message, std::string pass = {}, int line = 0)
    {
        return Error{kind, code, std::move(message), std::move(pass), line};
    }

    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        Error error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(Error e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }
    };

    struct Status
    {
        bool ok = true;
        Error error{};

        static Status success()
        {
            return Status{};
        }

        static Status failure(Error e)
        {
            return Status{false, std::move(e)};
        }
    };
}
