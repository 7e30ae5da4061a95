#ifndef ERRORMESSAGES_H
#define ERRORMESSAGES_H

#include <libintl.h>

#define _(String) gettext(String)

#define MSG_PAGE_UNAVAILABLE _("Can't load page.")
#define ERR_AUTOSTART_FAILED _("Could not change the autostart setting.")
#define ERR_INSTALLER_LAUNCH_FAILED _("Could not start the installer.")
#define ERR_LINK_UNAVAILABLE _("This link is not available.")

#endif
