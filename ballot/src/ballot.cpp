/**
 * Ballot contract implementation.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#include <ballot/ballot.hpp>
#include <eosiolib/print.hpp>

#include <tuple>

ballot::ballot(name self, name code, datastream<const char*> ds) : contract(self, code, ds), elections(self, self.value) {
    if (elections.exists()) {
        _election = elections.get();
    }
}

ballot::~ballot() {}

#pragma region Actions

void ballot::init(name creator, string election_name, vector<string> candidate_names) {
    require_auth(get_self());
    require_auth(creator);
    check(!elections.exists(), "election already initialized");

    validate_name(election_name,
        "invalid configuration: election name required",
        "invalid configuration: election name too long");
    check(!candidate_names.empty(), "invalid configuration: at least one candidate required");
    check(candidate_names.size() <= MAX_CANDIDATES, "invalid configuration: too many candidates");

    vector<candidate> new_candidates;
    new_candidates.reserve(candidate_names.size());

    for (const auto& cand_name : candidate_names) {
        validate_name(cand_name,
            "invalid configuration: candidate name required",
            "invalid configuration: candidate name too long");
        new_candidates.emplace_back(candidate{cand_name, 0});
    }

    _election = election{
        creator, //owner
        election_name, //election_name
        new_candidates, //candidates
        0 //total_votes
    };

    elections.set(_election, get_self());

    print("\nElection Created: ", election_name);
    print("\nOwner: ", creator, " Candidates: ", uint32_t(new_candidates.size()));
}

void ballot::authorize(name caller, name target) {
    require_auth(caller);
    require_initialized();
    require_owner(caller);
    check(is_account(target), "target account doesn't exist");

    voters_table voters(get_self(), get_self().value);
    auto v = voters.find(target.value);

    if (v == voters.end()) {
        voters.emplace(caller, [&](auto& row) {
            row.account = target;
            row.authorized = true;
            row.has_voted = false;
        });

        print("\nVoter Authorized: ", target);
    } else {
        //rows are only created here, already authorized
        print("\nVoter Already Authorized: ", target);
    }
}

void ballot::vote(name voter, uint16_t candidate_index) {
    require_auth(voter);
    require_initialized();

    auto record = get_voter(voter);

    //already voted is reported ahead of not authorized
    check(!record.has_voted, "already voted");
    check(record.authorized, "not authorized to vote");
    check(candidate_index < _election.candidates.size(), "invalid candidate");

    voters_table voters(get_self(), get_self().value);
    auto v = voters.find(voter.value);

    //row grows once choice is set, voter takes over the RAM
    voters.modify(v, voter, [&](auto& row) {
        row.has_voted = true;
        row.choice = candidate_index;
    });

    _election.candidates[candidate_index].vote_count += 1;
    _election.total_votes += 1;
    elections.set(_election, get_self());

    print("\nVote Cast: ", voter, " -> ", _election.candidates[candidate_index].name);
}

void ballot::tally(name caller) {
    require_auth(caller);
    require_initialized();
    require_owner(caller);

    const auto& cands = get_candidates();

    for (uint16_t i = 0; i < cands.size(); i++) {
        print("\n", cands[i].name, ": ", cands[i].vote_count);

        action(permission_level{get_self(), name("active")}, get_self(), name("candresult"), std::make_tuple(
            i,
            cands[i].name,
            cands[i].vote_count
        )).send();
    }

    print("\nTotal Votes: ", get_total_votes());
}

void ballot::candresult(uint16_t candidate_index, string candidate_name, uint64_t vote_count) {
    //NOTE: notification only, the data lives in the action trace
    require_auth(get_self());
}

void ballot::summary() {
    require_initialized();

    print("\nElection: ", get_election_name());
    print("\nTotal Votes: ", get_total_votes());

    const auto& cands = get_candidates();
    for (uint16_t i = 0; i < cands.size(); i++) {
        print("\n[", uint32_t(i), "] ", cands[i].name, ": ", cands[i].vote_count);
    }
}

#pragma endregion Actions

#pragma region Accessors

const vector<ballot::candidate>& ballot::get_candidates() const {
    return _election.candidates;
}

const string& ballot::get_election_name() const {
    return _election.election_name;
}

uint64_t ballot::get_total_votes() const {
    return _election.total_votes;
}

ballot::voter_record ballot::get_voter(name account) const {
    voters_table voters(get_self(), get_self().value);
    auto v = voters.find(account.value);

    if (v == voters.end()) {
        voter_record blank;
        blank.account = account;
        return blank;
    }

    return *v;
}

#pragma endregion Accessors

#pragma region Helpers

void ballot::require_initialized() {
    check(elections.exists(), "election not initialized");
}

void ballot::require_owner(name caller) const {
    check(caller == _election.owner, "unauthorized: caller is not the election owner");
}

void ballot::validate_name(const string& text, const char* missing_msg, const char* too_long_msg) const {
    check(!text.empty(), missing_msg);
    check(text.size() <= MAX_NAME_LENGTH, too_long_msg);
}

#pragma endregion Helpers

EOSIO_DISPATCH(ballot, (init)(authorize)(vote)(tally)(candresult)(summary))
