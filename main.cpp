#include "app/PolyglotApp.hpp"

int main(int argc, char** argv) {
    polyglot::app::PolyglotApp app;
    return app.Run(argc, argv);
}
