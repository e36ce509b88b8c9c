/** \file   RegexMatcher.h
 *  \brief  Interface for the RegexMatcher class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2014-2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <memory>
#include <string>
#include <stdexcept>
#include <vector>
#include <pcre.h>


/** \class  ThreadSafeRegexMatcher
 *  \brief  Wrapper class for simple use cases of the PCRE library.  Instances may be shared between threads.
 */
class ThreadSafeRegexMatcher {
public:
    class MatchResult {
        friend class ThreadSafeRegexMatcher;

        std::string subject_;
        bool matched_;
        unsigned match_count_;
        std::vector<int> substr_indices_;
        std::string error_message_;
    public:
        explicit MatchResult(const std::string &subject);
        MatchResult(const MatchResult &) = default;
        MatchResult(MatchResult &&) = default;
        MatchResult &operator=(const MatchResult &) = default;

        inline operator bool() const { return matched_; }
        inline unsigned size() const { return match_count_; }
        inline const std::string &getErrorMessage() const { return error_message_; }

        /** \brief Returns either the full match (group 0) or the n-th substring match.
         *  \throws std::out_of_range when "group" is not less than size().
         */
        std::string operator[](const unsigned group) const;
    };

    // We need this wrapper class to use the incomplete
    // PCRE types with the STL smart pointers
    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;
    public:
        PcreData() : pcre_(nullptr), pcre_extra_(nullptr) {}
        ~PcreData() {
            if (pcre_extra_ != nullptr)
                ::pcre_free_study(pcre_extra_);

            if (pcre_)
                ::pcre_free(pcre_);
        }
    };

    // These need to be powers of 2.
    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2, MULTILINE = 4, ENABLE_UCP = 8, DOT_MATCHES_NEWLINE = 16 };
private:
    static constexpr size_t MAX_SUBSTRING_MATCHES = 20;

    const std::string pattern_;
    const unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;
public:
    /** \note Aborts with an error message if "pattern" fails to compile. */
    explicit ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);
    ThreadSafeRegexMatcher(const ThreadSafeRegexMatcher &rhs)
        : pattern_(rhs.pattern_), options_(rhs.options_), pcre_data_(rhs.pcre_data_) {}

    inline const std::string &getPattern() const { return pattern_; }

    /** \param start_pos  If non-NULL and the match succeeded, the offset of the first matched character.
     *  \param end_pos    If non-NULL and the match succeeded, the offset after the last matched character.
     */
    MatchResult match(const std::string &subject, const size_t subject_start_offset = 0,
                      size_t * const start_pos = nullptr, size_t * const end_pos = nullptr) const;

    // Replaces all matches of the pattern with the replacement string.
    std::string replaceAll(const std::string &subject, const std::string &replacement) const;
};
