/** \file   RegexMatcher.cc
 *  \brief  Implementation of the RegexMatcher class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2015-2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "RegexMatcher.h"
#include "Compiler.h"
#include "util.h"


static bool CheckPCRE_UTF8Compatibility() {
    int utf8_available;
    if (::pcre_config(PCRE_CONFIG_UTF8, reinterpret_cast<void *>(&utf8_available)) == PCRE_ERROR_BADOPTION or utf8_available != 1) {
        LOG_ERROR("This version of the PCRE library does not support UTF8!");
    }

    return true;
}


static const bool dummy_variable(CheckPCRE_UTF8Compatibility());


ThreadSafeRegexMatcher::MatchResult::MatchResult(const std::string &subject): subject_(subject), matched_(false), match_count_(0) {
    substr_indices_.resize(ThreadSafeRegexMatcher::MAX_SUBSTRING_MATCHES * 3);
}


std::string ThreadSafeRegexMatcher::MatchResult::operator[](const unsigned group) const {
    if (unlikely(group >= match_count_)) {
        throw std::out_of_range("in ThreadSafeRegexMatcher::MatchResult::operator[]: group(" + std::to_string(group)
                                + ") >= " + std::to_string(match_count_) + "!");
    }

    const unsigned first_index(group * 2);
    const unsigned substring_length(substr_indices_[first_index + 1] - substr_indices_[first_index]);
    return (substring_length == 0) ? "" : subject_.substr(substr_indices_[first_index], substring_length);
}


namespace {


bool CompileRegex(const std::string &pattern, const unsigned options, ::pcre **pcre_arg, ::pcre_extra **pcre_extra_arg,
                  std::string * const err_msg) {
    if (err_msg != nullptr)
        err_msg->clear();

    const char *errptr;
    int erroffset;

    int pcre_options(0);
    if (options & ThreadSafeRegexMatcher::ENABLE_UTF8)
        pcre_options |= PCRE_UTF8;
    if (options & ThreadSafeRegexMatcher::ENABLE_UCP)
        pcre_options |= PCRE_UCP;
    if (options & ThreadSafeRegexMatcher::CASE_INSENSITIVE)
        pcre_options |= PCRE_CASELESS;
    if (options & ThreadSafeRegexMatcher::MULTILINE)
        pcre_options |= PCRE_MULTILINE;
    if (options & ThreadSafeRegexMatcher::DOT_MATCHES_NEWLINE)
        pcre_options |= PCRE_DOTALL;

    *pcre_arg = ::pcre_compile(pattern.c_str(), pcre_options, &errptr, &erroffset, nullptr);
    if (*pcre_arg == nullptr) {
        *pcre_extra_arg = nullptr;
        if (err_msg != nullptr)
            *err_msg = "failed to compile invalid regular expression: \"" + pattern + "\"! (" + std::string(errptr) + ")";
        return false;
    }

    // Can't use PCRE_STUDY_JIT_COMPILE because it's not thread safe.
    *pcre_extra_arg = ::pcre_study(*pcre_arg, 0, &errptr);
    if (*pcre_extra_arg == nullptr and errptr != nullptr) {
        ::pcre_free(*pcre_arg);
        *pcre_arg = nullptr;
        if (err_msg != nullptr)
            *err_msg = "failed to \"study\" the compiled pattern \"" + pattern + "\"! (" + std::string(errptr) + ")";
        return false;
    }

    return true;
}


} // unnamed namespace


ThreadSafeRegexMatcher::ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options)
    : pattern_(pattern), options_(options), pcre_data_(new PcreData) {
    std::string err_msg;
    if (not CompileRegex(pattern_, options_, &pcre_data_->pcre_, &pcre_data_->pcre_extra_, &err_msg))
        LOG_ERROR("failed to compile pattern: \"" + pattern + "\": " + err_msg);
}


ThreadSafeRegexMatcher::MatchResult ThreadSafeRegexMatcher::match(const std::string &subject, const size_t subject_start_offset,
                                                                  size_t * const start_pos, size_t * const end_pos) const {
    MatchResult match_result(subject);
    const int retcode(::pcre_exec(pcre_data_->pcre_, pcre_data_->pcre_extra_, subject.data(), subject.length(), subject_start_offset, 0,
                                  &match_result.substr_indices_[0], match_result.substr_indices_.size()));

    if (retcode == 0) {
        LOG_ERROR("Too many captured substrings! (We only support " + std::to_string(match_result.substr_indices_.size() / 3 - 1)
                  + " substrings.)");
    }

    if (retcode > 0) {
        match_result.match_count_ = retcode;
        match_result.matched_ = true;
        if (start_pos != nullptr)
            *start_pos = match_result.substr_indices_[0];
        if (end_pos != nullptr)
            *end_pos = match_result.substr_indices_[1];

        return match_result;
    }

    if (retcode != PCRE_ERROR_NOMATCH) {
        if (retcode == PCRE_ERROR_BADUTF8)
            match_result.error_message_ = "invalid UTF-8 in subject";
        else
            match_result.error_message_ = "unknown PCRE error for pattern '" + pattern_ + "': " + std::to_string(retcode);
    }

    return match_result;
}


std::string ThreadSafeRegexMatcher::replaceAll(const std::string &subject, const std::string &replacement) const {
    if (not match(subject))
        return subject;

    std::string replaced_string;
    // the matches need to be sequentially sorted from left to right
    size_t subject_start_offset(0), match_start_offset(0), match_end_offset(0);
    while (subject_start_offset < subject.length()) {
        if (not match(subject, subject_start_offset, &match_start_offset, &match_end_offset))
            break;

        if (subject_start_offset == match_start_offset and subject_start_offset == match_end_offset) {
            replaced_string += subject[subject_start_offset++];
            continue;
        }

        replaced_string += subject.substr(subject_start_offset, match_start_offset - subject_start_offset);
        replaced_string += replacement;
        subject_start_offset = match_end_offset;
    }

    while (subject_start_offset < subject.length())
        replaced_string += subject[subject_start_offset++];

    return replaced_string;
}
