/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#ifndef MGFEM_FE_EXCEPTION_H
#define MGFEM_FE_EXCEPTION_H

/**
 * @file FEException.h
 * @brief Exceptions thrown by the FE library and the checking macros
 *
 * Every exception records an FEStatus, the place it was thrown from and,
 * when MPI is running, the rank. Debug builds also keep a short backtrace.
 */

#include "Types.h"
#include "FEConfig.h"

#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

#if FE_HAS_MPI
#include <mpi.h>
#endif

#if defined(__GNUC__) && !defined(_WIN32)
#include <cxxabi.h>
#include <execinfo.h>
#endif

namespace mgfem {
namespace FE {

/**
 * @brief Root of the FE exception hierarchy
 *
 * what() is composed once at construction: status, rank, location and
 * message, followed by the backtrace in debug builds.
 */
class FEException : public std::exception {
public:
    explicit FEException(const std::string& message,
                         FEStatus status = FEStatus::Unknown)
        : FEException(message, "", 0, "", status) {}

    FEException(const std::string& message,
                const char* file,
                int line,
                const char* function = "",
                FEStatus status = FEStatus::Unknown)
        : message_(message), status_(status), file_(file), line_(line), function_(function) {
#if FE_HAS_MPI
        int initialized = 0;
        MPI_Initialized(&initialized);
        if (initialized) {
            MPI_Comm_rank(MPI_COMM_WORLD, &mpi_rank_);
        }
#endif
#if FE_DEBUG_MODE
        record_backtrace();
#endif
        compose();
    }

    ~FEException() noexcept override = default;

    const char* what() const noexcept override { return what_.c_str(); }

    FEStatus status() const noexcept { return status_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const std::string& function() const noexcept { return function_; }

    /// -1 unless MPI was initialized when the exception was thrown
    int mpi_rank() const noexcept { return mpi_rank_; }

    /// Empty in release builds
    const std::vector<std::string>& backtrace() const noexcept { return backtrace_; }

private:
    std::string message_;
    FEStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    int mpi_rank_{-1};
    std::vector<std::string> backtrace_;
    std::string what_;

    void record_backtrace() {
#if defined(__GNUC__) && !defined(_WIN32)
        constexpr int max_frames = 24;
        void* frames[max_frames];
        const int n = ::backtrace(frames, max_frames);
        char** symbols = ::backtrace_symbols(frames, n);
        if (symbols == nullptr) {
            return;
        }
        // Frame 0 is this function
        for (int i = 1; i < n; ++i) {
            std::string frame(symbols[i]);
            const auto open = frame.find('(');
            const auto plus = frame.find('+', open);
            if (open != std::string::npos && plus != std::string::npos) {
                int rc = 0;
                char* name = abi::__cxa_demangle(frame.substr(open + 1, plus - open - 1).c_str(),
                                                 nullptr, nullptr, &rc);
                if (rc == 0 && name != nullptr) {
                    frame.replace(open + 1, plus - open - 1, name);
                }
                std::free(name);
            }
            backtrace_.push_back(std::move(frame));
        }
        std::free(symbols);
#endif
    }

    void compose() {
        std::ostringstream os;
        os << "[FE Exception] " << status_to_string(status_);
        if (mpi_rank_ >= 0) {
            os << " (Rank " << mpi_rank_ << ")";
        }
        os << "\n";
        if (!file_.empty()) {
            os << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                os << " in " << function_ << "()";
            }
            os << "\n";
        }
        os << "  Message: " << message_ << "\n";
        for (std::size_t i = 0; i < backtrace_.size() && i < 10; ++i) {
            os << "    #" << i << " " << backtrace_[i] << "\n";
        }
        what_ = os.str();
    }
};

/// Bad argument value: out-of-range index, wrong length, null pointer
class InvalidArgumentException : public FEException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : FEException(message, file, line, function, FEStatus::InvalidArgument) {}
};

/**
 * @brief Unsupported or mismatched setup
 *
 * Unsupported cell family, element family or degree, and transfer operands
 * that are not on adjacent levels of one hierarchy with one element.
 */
class ConfigurationException : public FEException {
public:
    ConfigurationException(const std::string& message,
                           const char* file = "",
                           int line = 0,
                           const char* function = "")
        : FEException(message, file, line, function, FEStatus::ConfigurationError) {}
};

/// Geometry that contradicts the nesting of a hierarchy
class GeometricConsistencyException : public FEException {
public:
    GeometricConsistencyException(const std::string& message,
                                  const char* file = "",
                                  int line = 0,
                                  const char* function = "")
        : FEException(message, file, line, function, FEStatus::GeometricConsistency) {}
};

/// DofMap misuse; carries the offending DOF when there is one
class DofException : public FEException {
public:
    DofException(const std::string& message,
                 GlobalIndex dof_index = INVALID_GLOBAL_INDEX,
                 const char* file = "",
                 int line = 0)
        : FEException(dof_index == INVALID_GLOBAL_INDEX
                          ? message
                          : message + " (DOF " + std::to_string(dof_index) + ")",
                      file, line, "", FEStatus::DofError),
          dof_index_(dof_index) {}

    GlobalIndex dof_index() const noexcept { return dof_index_; }

private:
    GlobalIndex dof_index_;
};

#define FE_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define FE_THROW_IF(condition, ExceptionType, message) \
    do { \
        if (FE_UNLIKELY(condition)) { \
            FE_THROW(ExceptionType, message); \
        } \
    } while(0)

#define FE_CHECK_ARG(condition, message) \
    FE_THROW_IF(!(condition), InvalidArgumentException, message)

#define FE_CHECK_CONFIG(condition, message) \
    FE_THROW_IF(!(condition), ConfigurationException, message)

#define FE_CHECK_NOT_NULL(ptr, name) \
    FE_THROW_IF((ptr) == nullptr, InvalidArgumentException, std::string(name) + " is null")

#define FE_CHECK_INDEX(index, size) \
    FE_THROW_IF((index) < 0 || (index) >= (size), InvalidArgumentException, \
                "Index " + std::to_string(index) + " out of bounds [0, " + \
                std::to_string(size) + ")")

} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_EXCEPTION_H
