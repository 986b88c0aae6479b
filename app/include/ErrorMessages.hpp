#ifndef ERRORMESSAGES_H
#define ERRORMESSAGES_H

#include <libintl.h>

#define _(String) gettext(String)

#define MSG_NO_MATCHES _("No matches found for '{}'")
#define MSG_NOTHING_TO_CLEAN _("No files to clean up.")
#define MSG_TRY_HELP _("Try 'systoolkit help'.")

namespace ErrorMessages {
    // Text domain bound in main() so catalog lookups resolve translations
    inline constexpr const char* text_domain = "systoolkit";
}

#endif
