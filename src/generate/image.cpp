#include "crossword_csp/generate/image.hpp"
#include "crossword_csp/render.hpp"
#include <opencv2/opencv.hpp>
#include <stdexcept>

namespace crossword_csp {
namespace generate {

namespace {
constexpr int FONT_FACE = cv::FONT_HERSHEY_SIMPLEX;
constexpr double FONT_SCALE = 2.5;
constexpr int FONT_THICKNESS = 4;
}  // namespace

void save_image(const Puzzle& puzzle, const Assignment& assignment, const std::string& filename) {
    const int interior_size = CELL_SIZE - 2 * CELL_BORDER;
    const int rows = static_cast<int>(puzzle.height());
    const int cols = static_cast<int>(puzzle.width());
    LetterGrid letters = letter_grid(puzzle, assignment);

    cv::Mat img(rows * CELL_SIZE, cols * CELL_SIZE, CV_8UC3, cv::Scalar(0, 0, 0));

    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            if (!puzzle.is_open(i, j)) continue;

            cv::Rect rect(j * CELL_SIZE + CELL_BORDER, i * CELL_SIZE + CELL_BORDER,
                          interior_size, interior_size);
            cv::rectangle(img, rect, cv::Scalar(255, 255, 255), cv::FILLED);

            char letter = letters[i][j];
            if (letter == '\0') continue;

            std::string text(1, letter);
            int baseline = 0;
            cv::Size size = cv::getTextSize(text, FONT_FACE, FONT_SCALE, FONT_THICKNESS, &baseline);
            // putText の原点は文字の左下
            cv::Point origin(rect.x + (interior_size - size.width) / 2,
                             rect.y + (interior_size + size.height) / 2);
            cv::putText(img, text, origin, FONT_FACE, FONT_SCALE, cv::Scalar(0, 0, 0),
                        FONT_THICKNESS, cv::LINE_AA);
        }
    }

    bool written = false;
    try {
        written = cv::imwrite(filename, img);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Cannot write image: " + filename + " (" + e.what() + ")");
    }
    if (!written) {
        throw std::runtime_error("Cannot write image: " + filename);
    }
}

} // namespace generate
} // namespace crossword_csp
