/**
 * The ballot contract runs a single owner-managed election. The owner authorizes
 * accounts to vote, each authorized account casts exactly one vote for a candidate,
 * and the owner can publish the running tally at any time. Tallying is read-only,
 * it does not close the election.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/singleton.hpp>
#include <eosiolib/system.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace std;
using namespace eosio;

class [[eosio::contract("ballot")]] ballot : public contract {

public:

    ballot(name self, name code, datastream<const char*> ds);

    ~ballot();

    #pragma region Constants

    static constexpr uint16_t MAX_CANDIDATES = 64;

    static constexpr size_t MAX_NAME_LENGTH = 256; //bytes, applies to election and candidate names

    #pragma endregion Constants

    struct candidate {
        string name;
        uint64_t vote_count = 0;

        EOSLIB_SERIALIZE(candidate, (name)(vote_count))
    };

    //@scope get_self().value
    struct [[eosio::table]] election {
        name owner;
        string election_name;
        vector<candidate> candidates;
        uint64_t total_votes = 0;

        EOSLIB_SERIALIZE(election, (owner)(election_name)(candidates)(total_votes))
    };

    //@scope get_self().value
    struct [[eosio::table]] voter_record {
        name account;
        bool authorized = false;
        bool has_voted = false;
        std::optional<uint16_t> choice;

        uint64_t primary_key() const { return account.value; }
        EOSLIB_SERIALIZE(voter_record, (account)(authorized)(has_voted)(choice))
    };

    typedef singleton<name("election"), election> election_singleton;

    typedef multi_index<name("voters"), voter_record> voters_table;

    #pragma region Actions

    /**
     * Creates the election. Requires the contract account's authority and can only
     * succeed once; the creator becomes the permanent owner.
     */
    [[eosio::action]]
    void init(name creator, string election_name, vector<string> candidate_names);

    [[eosio::action]]
    void authorize(name caller, name target);

    [[eosio::action]]
    void vote(name voter, uint16_t candidate_index);

    /**
     * Emits one candresult notification per candidate, in candidate order.
     * Voting stays open afterwards.
     */
    [[eosio::action]]
    void tally(name caller);

    [[eosio::action]]
    void candresult(uint16_t candidate_index, string candidate_name, uint64_t vote_count);

    [[eosio::action]]
    void summary();

    #pragma endregion Actions

    #pragma region Accessors

    const vector<candidate>& get_candidates() const;

    const string& get_election_name() const;

    uint64_t get_total_votes() const;

    //returns an unauthorized, unvoted record for accounts without a row
    voter_record get_voter(name account) const;

    #pragma endregion Accessors

protected:

    void require_initialized();

    void require_owner(name caller) const;

    void validate_name(const string& text, const char* missing_msg, const char* too_long_msg) const;

    election_singleton elections;
    election _election;
};
