// Configure-time check: exits 0 when the linked SQLite was built with FTS5
#include <sqlite3.h>
int main() {
    return sqlite3_compileoption_used("ENABLE_FTS5") ? 0 : 1;
}
