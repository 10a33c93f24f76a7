#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>

namespace cadence::util {

/// Fold text for accent- and case-insensitive matching:
/// "Björk" and "BJORK" both become "bjork"
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // NFD splits ö into o + combining diaeresis, the mark is removed, and
    // Latin-ASCII maps what is left (ß, æ, ...) to plain ASCII
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> trans(
        icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        )
    );

    if (U_SUCCESS(status) && trans) {
        trans->transliterate(unicode_text);
    }
    // else: lowercase only

    std::string result;
    unicode_text.toLower().toUTF8String(result);
    return result;
}

/// Case-folded comparison, strcmp-style result
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    ua.foldCase();
    ub.foldCase();

    return ua.compare(ub);
}

}  // namespace cadence::util
