#pragma once

// Common path
#define ROOT									"/var/lib/trustguard/"

// Config
#define CONFIG_PATH								"/etc/trustguard/"
#define CONFIG_FILE								CONFIG_PATH "guard.json"

// Sqlite DB
#define DB_PATH									ROOT "db/"
#define DB										"trustguard.db"
