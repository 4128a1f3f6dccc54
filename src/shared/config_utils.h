#ifndef CONFIG_UTILS_H
#define CONFIG_UTILS_H

#include <stddef.h>

/* Build a config file path inside $XDG_CONFIG_HOME/lumen or ~/.config/lumen */
void config_build_path(char *buf, size_t len, const char *filename);

/* Same as config_build_path, but creates the lumen config directory first.
 * Returns 0 on success, -1 if the directory could not be created.
 */
int config_ensure_dir(char *buf, size_t len, const char *filename);

/* Read an integer value from a simple "key value" config file.
 * Returns default_value if file/key is missing or the value is not a number.
 */
int config_read_int(const char *filename, const char *key, int default_value);

/* Copy the raw value of key into out (NUL terminated, truncated to len).
 * Returns 1 if the key was found, 0 otherwise (out then holds default_value).
 */
int config_read_string(const char *filename, const char *key,
                       char *out, size_t len, const char *default_value);

/* Write a single key/value pair to the config file, replacing an existing
 * line for the same key and creating the lumen config directory if needed.
 * Returns 0 on success, -1 on I/O failure.
 */
int config_write_int(const char *filename, const char *key, int value);
int config_write_string(const char *filename, const char *key, const char *value);

#endif /* CONFIG_UTILS_H */
