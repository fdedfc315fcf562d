#pragma once

#include "card.hpp"
#include "errors.hpp"

#include <cstdint>
#include <memory>
#include <vector>

/// Abstract interface to the hardware that reads and writes physical cards.
/// Failures are reported by throwing KernelError.
class CardBackend {
public:
    virtual ~CardBackend() = default;

    /// Live state of a card in range
    virtual const Card& read(uint16_t card_id) = 0;

    /// Same as read, but grants exclusive mutation access until release()
    virtual Card& read_mutable(uint16_t card_id) = 0;

    /// End a read_mutable acquisition (never throws)
    virtual void release(uint16_t card_id) = 0;

    /// Push a raw payload to the physical card
    virtual void write(const Card& card, const std::vector<uint8_t>& data) = 0;

    /// Poll for cards in range. Never throws; hardware failures are logged.
    virtual void sense() = 0;

    /// Ids found by the last sense(), ascending
    virtual std::vector<uint16_t> present() const = 0;
};

/// Scoped read_mutable acquisition, released on every exit path
class CardLease {
public:
    CardLease(CardBackend& backend, uint16_t card_id);
    ~CardLease();

    CardLease(const CardLease&) = delete;
    CardLease& operator=(const CardLease&) = delete;

    uint16_t card_id() const { return card_id_; }

    Card& operator*() const { return *card_; }
    Card* operator->() const { return card_; }

private:
    CardBackend& backend_;
    uint16_t card_id_;
    Card* card_;
};

/// Create the card backend selected at build time
std::unique_ptr<CardBackend> create_card_backend();
