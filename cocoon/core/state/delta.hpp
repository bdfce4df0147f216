// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/core/types/hash.hpp>

namespace cocoon {

class SlotState;

namespace state {

    // Delta is a revertible change made to SlotState.
    class Delta {
      public:
        Delta(const Delta&) = delete;
        Delta& operator=(const Delta&) = delete;

        virtual ~Delta() = default;

        virtual void revert(SlotState& state) noexcept = 0;

      protected:
        Delta() = default;
    };

    // Ledger entry update created.
    class CreateDelta : public Delta {
      public:
        explicit CreateDelta(const Address& address) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        Address address_;
    };

    // Parallel balance updated.
    class ParallelBalanceDelta : public Delta {
      public:
        ParallelBalanceDelta(const Address& address, std::optional<Amount> previous) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        Address address_;
        std::optional<Amount> previous_;
    };

    // Sequential balance updated.
    class SequentialBalanceDelta : public Delta {
      public:
        SequentialBalanceDelta(const Address& address, std::optional<Amount> previous) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        Address address_;
        std::optional<Amount> previous_;
    };

    // Bytecode deployed.
    class BytecodeDelta : public Delta {
      public:
        BytecodeDelta(const Address& address, std::optional<Bytes> previous) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        Address address_;
        std::optional<Bytes> previous_;
    };

    // Datastore value written or deleted. An absent previous means the key was not updated yet.
    class DatastoreDelta : public Delta {
      public:
        DatastoreDelta(const Address& address, Bytes key, std::optional<std::optional<Bytes>> previous) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        Address address_;
        Bytes key_;
        std::optional<std::optional<Bytes>> previous_;
    };

    // Roll count changed.
    class RollDelta : public Delta {
      public:
        RollDelta(const Address& address, std::optional<RollCount> previous) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        Address address_;
        std::optional<RollCount> previous_;
    };

    // Operation marked as executed.
    class ExecutedOpDelta : public Delta {
      public:
        explicit ExecutedOpDelta(const OperationId& id) noexcept;

        void revert(SlotState& state) noexcept override;

      private:
        OperationId id_;
    };

}  // namespace state
}  // namespace cocoon
