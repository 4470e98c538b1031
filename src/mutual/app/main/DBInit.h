//------------------------------------------------------------------------------
/*
    This file is part of mutuald.
    Copyright (c) 2024 The mutuald developers.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#ifndef MUTUAL_APP_MAIN_DBINIT_H_INCLUDED
#define MUTUAL_APP_MAIN_DBINIT_H_INCLUDED

#include <array>

namespace mutual {

////////////////////////////////////////////////////////////////////////////////

// Money columns hold whole cents, rate columns hundredths. Dates are
// YYYY-MM-DD text, instants ISO-8601 UTC text. Status and kind columns hold
// the canonical spelling of the matching enum and nothing else.

inline constexpr char const* MutualDBName{"mutual.db"};

inline constexpr std::array<char const*, 1> MutualDBPragma{
    {"PRAGMA foreign_keys=ON;"}};

inline constexpr std::array<char const*, 32> MutualDBInit{
    {"BEGIN TRANSACTION;",

     "CREATE TABLE IF NOT EXISTS members (                  \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        name            TEXT NOT NULL,                      \
        user_ref        TEXT UNIQUE,                        \
        status          TEXT NOT NULL,                      \
        created_at      TEXT NOT NULL                       \
    );",

     // Organization accounts have no member. A member sub-account is
     // unique per (member, fund kind).
     "CREATE TABLE IF NOT EXISTS accounts (                 \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        code            TEXT NOT NULL UNIQUE,               \
        name            TEXT NOT NULL,                      \
        type            TEXT NOT NULL,                      \
        member_id       INTEGER REFERENCES members(id),     \
        fund_kind       TEXT,                               \
        created_at      TEXT NOT NULL                       \
    );",
     "CREATE UNIQUE INDEX IF NOT EXISTS AccountByMemberFund \
        ON accounts(member_id, fund_kind)                   \
        WHERE member_id IS NOT NULL;",

     "CREATE TABLE IF NOT EXISTS cycles (                   \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        year            INTEGER NOT NULL,                   \
        start_date      TEXT NOT NULL,                      \
        end_date        TEXT NOT NULL,                      \
        status          TEXT NOT NULL,                      \
        social_required INTEGER,                            \
        admin_required  INTEGER,                            \
        created_by      TEXT NOT NULL,                      \
        created_at      TEXT NOT NULL                       \
    );",

     "CREATE TABLE IF NOT EXISTS journal_entries (          \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        entry_date      TEXT NOT NULL,                      \
        description     TEXT NOT NULL,                      \
        cycle_id        INTEGER REFERENCES cycles(id),      \
        source_type     TEXT,                               \
        source_ref      INTEGER,                            \
        created_by      TEXT,                               \
        created_at      TEXT NOT NULL,                      \
        reversed_by     TEXT,                               \
        reversed_at     TEXT,                               \
        reversal_reason TEXT,                               \
        reversal_entry_id INTEGER                           \
    );",
     "CREATE INDEX IF NOT EXISTS EntryBySource              \
        ON journal_entries(source_type, source_ref);",

     "CREATE TABLE IF NOT EXISTS journal_lines (            \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        entry_id        INTEGER NOT NULL                    \
                        REFERENCES journal_entries(id),     \
        account_id      INTEGER NOT NULL                    \
                        REFERENCES accounts(id),            \
        debit           INTEGER NOT NULL DEFAULT 0,         \
        credit          INTEGER NOT NULL DEFAULT 0,         \
        memo            TEXT                                \
    );",
     "CREATE INDEX IF NOT EXISTS LineByEntry                \
        ON journal_lines(entry_id);",
     "CREATE INDEX IF NOT EXISTS LineByAccount              \
        ON journal_lines(account_id);",

     "CREATE TABLE IF NOT EXISTS penalty_types (            \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        name            TEXT NOT NULL UNIQUE,               \
        description     TEXT,                               \
        fee             INTEGER NOT NULL,                   \
        enabled         INTEGER NOT NULL DEFAULT 1          \
    );",

     "CREATE TABLE IF NOT EXISTS cycle_phases (             \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        cycle_id        INTEGER NOT NULL REFERENCES cycles(id), \
        phase_type      TEXT NOT NULL,                      \
        start_day       INTEGER,                            \
        end_day         INTEGER,                            \
        is_open         INTEGER NOT NULL DEFAULT 0,         \
        penalty_type_id INTEGER REFERENCES penalty_types(id), \
        auto_apply      INTEGER NOT NULL DEFAULT 0,         \
        UNIQUE (cycle_id, phase_type)                       \
    );",

     "CREATE TABLE IF NOT EXISTS posting_locks (            \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        cycle_id        INTEGER NOT NULL UNIQUE             \
                        REFERENCES cycles(id),              \
        locked_by       TEXT NOT NULL,                      \
        reason          TEXT,                               \
        created_at      TEXT NOT NULL                       \
    );",

     "CREATE TABLE IF NOT EXISTS declarations (             \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        member_id       INTEGER NOT NULL REFERENCES members(id), \
        cycle_id        INTEGER NOT NULL REFERENCES cycles(id), \
        effective_month TEXT NOT NULL,                      \
        savings         INTEGER NOT NULL DEFAULT 0,         \
        social_fund     INTEGER NOT NULL DEFAULT 0,         \
        admin_fund      INTEGER NOT NULL DEFAULT 0,         \
        penalties       INTEGER NOT NULL DEFAULT 0,         \
        interest        INTEGER NOT NULL DEFAULT 0,         \
        loan_repayment  INTEGER NOT NULL DEFAULT 0,         \
        status          TEXT NOT NULL,                      \
        created_at      TEXT NOT NULL,                      \
        updated_by      TEXT,                               \
        updated_at      TEXT,                               \
        UNIQUE (member_id, cycle_id, effective_month)       \
    );",

     // A declaration has at most one proof. Resubmission after a rejection
     // replaces its contents.
     "CREATE TABLE IF NOT EXISTS deposit_proofs (           \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        declaration_id  INTEGER NOT NULL UNIQUE             \
                        REFERENCES declarations(id),        \
        amount          INTEGER NOT NULL,                   \
        reference       TEXT,                               \
        status          TEXT NOT NULL,                      \
        uploaded_at     TEXT NOT NULL,                      \
        rejection_comment TEXT,                             \
        rejected_by     TEXT,                               \
        rejected_at     TEXT,                               \
        member_response TEXT,                               \
        responded_at    TEXT                                \
    );",

     "CREATE TABLE IF NOT EXISTS deposit_approvals (        \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        proof_id        INTEGER NOT NULL UNIQUE             \
                        REFERENCES deposit_proofs(id),      \
        journal_entry_id INTEGER NOT NULL UNIQUE            \
                        REFERENCES journal_entries(id),     \
        approved_by     TEXT NOT NULL,                      \
        approved_at     TEXT NOT NULL                       \
    );",

     "CREATE TABLE IF NOT EXISTS penalty_records (          \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        member_id       INTEGER NOT NULL REFERENCES members(id), \
        penalty_type_id INTEGER NOT NULL                    \
                        REFERENCES penalty_types(id),       \
        status          TEXT NOT NULL,                      \
        effective_month TEXT,                               \
        date_issued     TEXT NOT NULL,                      \
        notes           TEXT,                               \
        created_by      TEXT NOT NULL,                      \
        created_at      TEXT NOT NULL,                      \
        approved_by     TEXT,                               \
        approved_at     TEXT,                               \
        paid_at         TEXT,                               \
        journal_entry_id INTEGER REFERENCES journal_entries(id) \
    );",
     "CREATE UNIQUE INDEX IF NOT EXISTS PenaltyByMemberMonth \
        ON penalty_records(member_id, penalty_type_id, effective_month) \
        WHERE effective_month IS NOT NULL;",
     "CREATE INDEX IF NOT EXISTS PenaltyByMemberStatus      \
        ON penalty_records(member_id, status);",

     "CREATE TABLE IF NOT EXISTS credit_tiers (             \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        name            TEXT NOT NULL UNIQUE,               \
        description     TEXT,                               \
        tier_order      INTEGER NOT NULL DEFAULT 0          \
    );",

     "CREATE TABLE IF NOT EXISTS member_credit_ratings (    \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        member_id       INTEGER NOT NULL REFERENCES members(id), \
        cycle_id        INTEGER NOT NULL REFERENCES cycles(id), \
        tier_id         INTEGER NOT NULL REFERENCES credit_tiers(id), \
        assigned_by     TEXT NOT NULL,                      \
        assigned_at     TEXT NOT NULL,                      \
        UNIQUE (member_id, cycle_id)                        \
    );",

     "CREATE TABLE IF NOT EXISTS borrowing_policies (       \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        tier_id         INTEGER NOT NULL REFERENCES credit_tiers(id), \
        multiplier      INTEGER NOT NULL,                   \
        effective_from  TEXT NOT NULL,                      \
        max_amount      INTEGER                             \
    );",
     "CREATE INDEX IF NOT EXISTS PolicyByTierDate           \
        ON borrowing_policies(tier_id, effective_from);",

     // A NULL term is the wildcard for every term.
     "CREATE TABLE IF NOT EXISTS interest_ranges (          \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        tier_id         INTEGER NOT NULL REFERENCES credit_tiers(id), \
        cycle_id        INTEGER NOT NULL REFERENCES cycles(id), \
        term_months     INTEGER,                            \
        rate            INTEGER NOT NULL                    \
    );",
     "CREATE UNIQUE INDEX IF NOT EXISTS RangeByTierCycleTerm \
        ON interest_ranges(tier_id, cycle_id, IFNULL(term_months, 0));",

     "CREATE TABLE IF NOT EXISTS loan_applications (        \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        member_id       INTEGER NOT NULL REFERENCES members(id), \
        cycle_id        INTEGER NOT NULL REFERENCES cycles(id), \
        amount          INTEGER NOT NULL,                   \
        term_months     INTEGER NOT NULL,                   \
        status          TEXT NOT NULL,                      \
        notes           TEXT,                               \
        applied_at      TEXT NOT NULL,                      \
        reviewed_by     TEXT,                               \
        reviewed_at     TEXT,                               \
        review_notes    TEXT                                \
    );",
     "CREATE INDEX IF NOT EXISTS ApplicationByMember        \
        ON loan_applications(member_id, status);",

     "CREATE TABLE IF NOT EXISTS loans (                    \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        application_id  INTEGER UNIQUE                      \
                        REFERENCES loan_applications(id),   \
        member_id       INTEGER NOT NULL REFERENCES members(id), \
        cycle_id        INTEGER NOT NULL REFERENCES cycles(id), \
        amount          INTEGER NOT NULL,                   \
        interest_rate   INTEGER NOT NULL,                   \
        term_months     INTEGER NOT NULL,                   \
        status          TEXT NOT NULL,                      \
        created_at      TEXT NOT NULL,                      \
        disbursed_on    TEXT,                               \
        disbursement_entry_id INTEGER                       \
                        REFERENCES journal_entries(id),     \
        closed_at       TEXT                                \
    );",
     "CREATE INDEX IF NOT EXISTS LoanByMember               \
        ON loans(member_id, status);",

     "CREATE TABLE IF NOT EXISTS repayments (               \
        id              INTEGER PRIMARY KEY AUTOINCREMENT,  \
        loan_id         INTEGER NOT NULL REFERENCES loans(id), \
        journal_entry_id INTEGER NOT NULL                   \
                        REFERENCES journal_entries(id),     \
        principal       INTEGER NOT NULL DEFAULT 0,         \
        interest        INTEGER NOT NULL DEFAULT 0,         \
        repayment_date  TEXT NOT NULL,                      \
        created_at      TEXT NOT NULL                       \
    );",
     "CREATE INDEX IF NOT EXISTS RepaymentByLoan            \
        ON repayments(loan_id);",

     "END TRANSACTION;"}};

}  // namespace mutual

#endif
