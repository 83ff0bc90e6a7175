#pragma once

#include <string>
#include <utility>

// A simple implementation of a Status class similar to RocksDB's design.
class Status {
  public:
    // Error codes used to represent the result of an operation.
    enum Code {
        kOk = 0,
        kNotFound,
        kUnknownParent,
        kDuplicateName,
        kSelfParent,
        kCycleRejected,
        kRootUndeletable,
        kRootImmovable,
        kPermissionDenied,
        kInvalidArgument,
        kCorruption,
        kStorageFailure,
    };

    // Default constructor creates an OK status.
    Status() : code_(kOk), msg_("") {}

    // Constructor for creating an error status with a message.
    Status(Code code, std::string msg) : code_(code), msg_(std::move(msg)) {}

    Status(const Status &other) = default;
    Status(Status &&other) noexcept = default;
    Status &operator=(const Status &other) = default;
    Status &operator=(Status &&other) noexcept = default;

    // Returns true if the status represents success.
    bool ok() const { return code_ == kOk; }

    Code code() const { return code_; }
    const std::string &message() const { return msg_; }

    bool IsNotFound() const { return code_ == kNotFound; }
    bool IsStorageFailure() const { return code_ == kStorageFailure; }

    // Validation failures are reported back to the caller and never leave
    // any state mutated.
    bool IsValidationError() const {
        switch (code_) {
        case kNotFound:
        case kUnknownParent:
        case kDuplicateName:
        case kSelfParent:
        case kCycleRejected:
        case kRootUndeletable:
        case kRootImmovable:
        case kPermissionDenied:
        case kInvalidArgument:
            return true;
        default:
            return false;
        }
    }

    // Returns a human-readable string representation of this status.
    std::string ToString() const {
        if (ok()) {
            return "OK";
        } else {
            return CodeToString(code_) + ": " + msg_;
        }
    }

    // Factory methods for common statuses.
    static Status OK() { return Status(); }
    static Status NotFound(const std::string &msg) {
        return Status(kNotFound, msg);
    }
    static Status UnknownParent(const std::string &msg) {
        return Status(kUnknownParent, msg);
    }
    static Status DuplicateName(const std::string &msg) {
        return Status(kDuplicateName, msg);
    }
    static Status SelfParent(const std::string &msg) {
        return Status(kSelfParent, msg);
    }
    static Status CycleRejected(const std::string &msg) {
        return Status(kCycleRejected, msg);
    }
    static Status RootUndeletable(const std::string &msg) {
        return Status(kRootUndeletable, msg);
    }
    static Status RootImmovable(const std::string &msg) {
        return Status(kRootImmovable, msg);
    }
    static Status PermissionDenied(const std::string &msg) {
        return Status(kPermissionDenied, msg);
    }
    static Status InvalidArgument(const std::string &msg) {
        return Status(kInvalidArgument, msg);
    }
    static Status Corruption(const std::string &msg) {
        return Status(kCorruption, msg);
    }
    static Status StorageFailure(const std::string &msg) {
        return Status(kStorageFailure, msg);
    }

    // Comparison operators.
    bool operator==(const Status &other) const {
        return code_ == other.code_ && msg_ == other.msg_;
    }
    bool operator!=(const Status &other) const { return !(*this == other); }

    // Helper function to convert an error code to a string.
    static std::string CodeToString(Code code) {
        switch (code) {
        case kOk:
            return "OK";
        case kNotFound:
            return "NotFound";
        case kUnknownParent:
            return "UnknownParent";
        case kDuplicateName:
            return "DuplicateName";
        case kSelfParent:
            return "SelfParent";
        case kCycleRejected:
            return "CycleRejected";
        case kRootUndeletable:
            return "RootUndeletable";
        case kRootImmovable:
            return "RootImmovable";
        case kPermissionDenied:
            return "PermissionDenied";
        case kInvalidArgument:
            return "InvalidArgument";
        case kCorruption:
            return "Corruption";
        case kStorageFailure:
            return "StorageFailure";
        default:
            return "UnknownError";
        }
    }

  private:
    Code code_;
    std::string msg_;
};
