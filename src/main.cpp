#include "autorun_app.h"

int main() {
    autorun::core::Paths paths;
    paths.loadFromEnv();

    autorun::AutorunApp app(paths);
    return app.run();
}
