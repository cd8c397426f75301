#include "rain/plot.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rain {

void SvgPlotter::hyetograph(const std::string& path,
                            double width, double height,
                            const EventSegmentation& seg) const
{
    if (seg.size() == 0) return;

    const size_t N = seg.size();
    double ymax = *std::max_element(seg.precip.begin(), seg.precip.end());
    if (ymax <= 0) ymax = 1.0;

    const double left=60, right=20, top=20, bottom=40;
    const double W = width, H = height;
    const double plotW = W - left - right;
    const double plotH = H - top - bottom;
    const double barW = plotW / static_cast<double>(N);

    std::ofstream s(path);
    if (!s) throw std::runtime_error("cannot open output file: " + path);
    s << "<svg xmlns='http://www.w3.org/2000/svg' width='"<<W<<"' height='"<<H<<"' viewBox='0 0 "<<W<<" "<<H<<"'>\n";
    s << "<rect x='0' y='0' width='"<<W<<"' height='"<<H<<"' fill='white' stroke='none'/>\n";

    for (size_t i=0; i<N; ) {
        size_t j = i;
        while (j < N && seg.event_id[j] == seg.event_id[i]) ++j;
        if (seg.event_type[i] == Weather::Wet) {
            s << "<rect x='"<<(left + i*barW)<<"' y='"<<top<<"' width='"<<((j-i)*barW)
              <<"' height='"<<plotH<<"' fill='#dbe9f6' stroke='none'/>\n";
        }
        i = j;
    }

    for (size_t i=0; i<N; ++i) {
        if (seg.precip[i] <= 0) continue;
        const double h = seg.precip[i] / ymax * plotH;
        s << "<rect x='"<<(left + i*barW)<<"' y='"<<(top + plotH - h)<<"' width='"<<barW
          <<"' height='"<<h<<"' fill='black' stroke='none'/>\n";
    }

    s << "<line x1='"<<left<<"' y1='"<<top<<"' x2='"<<left<<"' y2='"<<(H-bottom)
      <<"' stroke='black' stroke-width='1'/>\n";
    s << "<line x1='"<<left<<"' y1='"<<(H-bottom)<<"' x2='"<<(W-right)<<"' y2='"<<(H-bottom)
      <<"' stroke='black' stroke-width='1'/>\n";
    s << "<text x='5' y='"<<(top+10)<<"' font-size='12'>max "<<ymax<<"</text>\n";
    s << "<text x='"<<left<<"' y='"<<(H-bottom+15)<<"' font-size='12'>"<<format_timestamp(seg.times.front())<<"</text>\n";
    s << "<text x='"<<(W-right)<<"' y='"<<(H-bottom+15)<<"' font-size='12' text-anchor='end'>"
      <<format_timestamp(seg.times.back())<<"</text>\n";
    s << "</svg>\n";

    std::cout << "✓ SVG: " << path << "\n";
}

} // namespace rain
